#ifndef CODEBOX_PRELUDE_H_
#define CODEBOX_PRELUDE_H_

// Python bootstrap run inside the jail:
//   python3 -I -B -u prelude.py <manifest.json> <submission.py>
// It binds exactly the manifest's names, runs the submission with restricted
// builtins and reports the outcome as a "finish" message on the helper channel.
extern const char kPreludeSource[];

// file name the submission is compiled under; tracebacks are filtered by it
extern const char kSubmissionFilename[];

#endif  // CODEBOX_PRELUDE_H_
