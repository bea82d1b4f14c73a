#include <gtest/gtest.h>
#include <glyphchain/common/error.hpp>
#include <glyphchain/config/options.hpp>
#include <glyphchain/testing/common.hpp>

#include <boost/program_options.hpp>

#include <fstream>
#include <initializer_list>
#include <string>
#include <vector>

namespace {

glyphchain::config::invocation_t parse(
    const std::initializer_list<const char*> args) {
  auto argv = std::vector<const char*>{"glyphchain"};
  argv.insert(argv.end(), args.begin(), args.end());
  return glyphchain::config::parse(static_cast<int>(argv.size()), argv.data());
}

/// Temporary config file, removed on scope exit.
struct config_file final {
  explicit config_file(const std::string& content)
      : path{glyphchain::testing::make_db_path("glyphchain_config") + ".ini"} {
    auto out = std::ofstream{path};
    out << content;
  }
  ~config_file() { glyphchain::testing::remove_path(path); }

  std::string path;
};

}  // namespace

TEST(config_options, defaults) {
  auto call = parse({"feed"});
  const auto& options = call.options;
  EXPECT_EQ(call.command, "feed");
  EXPECT_TRUE(call.arguments.empty());
  EXPECT_FALSE(call.help);
  EXPECT_EQ(options.db_path, "glyphchain.db");
  EXPECT_EQ(options.limits.target_chunk_chars, 250u);
  EXPECT_EQ(options.limits.max_unit_bytes, 1200u);
  EXPECT_EQ(options.retry.max_attempts, 3u);
  EXPECT_EQ(options.retry.retry_delay, std::chrono::milliseconds{2000});
  EXPECT_EQ(options.retry.submit_timeout, std::chrono::milliseconds{30000});
  EXPECT_EQ(options.feed.limit_per_author, 3u);
  EXPECT_EQ(options.feed.max_total, 20u);
  EXPECT_TRUE(options.feed.use_cache);
  EXPECT_EQ(options.feed.cache_ttl, std::chrono::milliseconds{30000});
  EXPECT_EQ(options.network, "localnet");
  EXPECT_EQ(options.log_level, "info");
  EXPECT_TRUE(options.log_file.empty());
  EXPECT_NE(call.usage.find("verify-genesis"), std::string::npos);
}

TEST(config_options, command_line_overrides) {
  auto call = parse({"--db", "/tmp/other.db", "--target-chunk-chars", "120",
                     "--retry-delay-ms", "5", "--max-total", "7",
                     "--no-cache", "-t", "My title", "publish", "doc.txt"});
  EXPECT_EQ(call.options.db_path, "/tmp/other.db");
  EXPECT_EQ(call.options.limits.target_chunk_chars, 120u);
  EXPECT_EQ(call.options.retry.retry_delay, std::chrono::milliseconds{5});
  EXPECT_EQ(call.options.feed.max_total, 7u);
  EXPECT_FALSE(call.options.feed.use_cache);
  EXPECT_EQ(call.title, "My title");
  EXPECT_EQ(call.command, "publish");
  EXPECT_EQ(call.arguments, std::vector<std::string>{"doc.txt"});
}

TEST(config_options, positional_arguments_are_kept_in_order) {
  auto call = parse({"author", "abcdef", "5"});
  EXPECT_EQ(call.command, "author");
  EXPECT_EQ(call.arguments, (std::vector<std::string>{"abcdef", "5"}));
}

TEST(config_options, config_file_is_read_and_command_line_wins) {
  auto file = config_file{
      "db = /var/lib/glyphchain\n"
      "network = testnet\n"
      "max-attempts = 5\n"
      "cache-ttl-ms = 100\n"
      "log-level = debug\n"};
  auto call = parse({"--config", file.path.c_str(), "--network", "devnet",
                     "operations"});
  EXPECT_EQ(call.options.db_path, "/var/lib/glyphchain");
  EXPECT_EQ(call.options.network, "devnet");
  EXPECT_EQ(call.options.retry.max_attempts, 5u);
  EXPECT_EQ(call.options.feed.cache_ttl, std::chrono::milliseconds{100});
  EXPECT_EQ(call.options.log_level, "debug");
}

TEST(config_options, help_skips_validation) {
  auto call = parse({"--help", "--max-attempts", "0"});
  EXPECT_TRUE(call.help);
  EXPECT_TRUE(call.command.empty());
}

TEST(config_options, rejects_values_that_cannot_work) {
  auto code_of = [](const std::initializer_list<const char*> args) {
    try {
      parse(args);
    } catch (const glyphchain::common::error& e) {
      return e.code();
    }
    ADD_FAILURE() << "parse succeeded";
    return glyphchain::common::error_code::not_found;
  };
  using glyphchain::common::error_code;
  EXPECT_EQ(code_of({"--max-attempts", "0", "feed"}),
            error_code::invalid_argument);
  EXPECT_EQ(code_of({"--target-chunk-chars", "0", "feed"}),
            error_code::invalid_argument);
  EXPECT_EQ(code_of({"--max-unit-bytes", "16", "feed"}),
            error_code::invalid_argument);
  EXPECT_EQ(code_of({"--log-level", "loud", "feed"}),
            error_code::invalid_argument);
}

TEST(config_options, malformed_input_is_a_program_options_error) {
  EXPECT_THROW(parse({"--no-such-option", "feed"}),
               boost::program_options::error);
  EXPECT_THROW(parse({"--max-attempts", "many", "feed"}),
               boost::program_options::error);

  auto file = config_file{"unknown-key = 1\n"};
  EXPECT_THROW(parse({"--config", file.path.c_str(), "feed"}),
               boost::program_options::error);
}

TEST(config_options, validate_accepts_defaults) {
  EXPECT_NO_THROW(glyphchain::config::validate(glyphchain::config::options_t{}));
  auto options = glyphchain::config::options_t{};
  options.log_level = "off";
  EXPECT_NO_THROW(glyphchain::config::validate(options));
  options.db_path.clear();
  EXPECT_THROW(glyphchain::config::validate(options), glyphchain::common::error);
}
