#include <gtest/gtest.h>
#include <spdlog/spdlog.h>
#include <codebox/paths.h>
#include <codebox/logger.h>

spdlog::level::level_enum log_level;

class MyEnvironment : public ::testing::Environment {
 public:
  void SetUp() override {
    InitLogger();
    spdlog::set_pattern("[%P] %+");
    spdlog::set_level(log_level);
    kBoxRoot = fs::temp_directory_path() / "codebox-test";
  }
  void TearDown() override {
    std::error_code ec;
    fs::remove_all(kBoxRoot, ec);
  }
};

testing::Environment* const my_env = testing::AddGlobalTestEnvironment(new MyEnvironment);

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  if (argc) internal::kDataDir = fs::absolute(fs::path(argv[0])).parent_path();
  log_level = spdlog::level::warn;
  if (argc > 1) {
    if (std::string("-v") == argv[1]) log_level = spdlog::level::info;
    if (std::string("-vv") == argv[1]) log_level = spdlog::level::debug;
  }
  return RUN_ALL_TESTS();
}
