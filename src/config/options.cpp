#include <glyphchain/common/error.hpp>
#include <glyphchain/config/options.hpp>
#include <glyphchain/ledger/unit_codec.hpp>

#include <spdlog/common.h>

#include <cstdint>
#include <sstream>

namespace glyphchain::config {

namespace po = boost::program_options;

namespace {

glyphchain::common::error invalid(const std::string& message) {
  return glyphchain::common::error{
      glyphchain::common::error_code::invalid_argument, message};
}

auto milliseconds_into(std::chrono::milliseconds& target) {
  return [&target](const uint64_t value) {
    target = std::chrono::milliseconds{value};
  };
}

}  // namespace

po::options_description describe(options_t& options) {
  auto storage = po::options_description{"Storage"};
  storage.add_options()(
      "db", po::value<std::string>(&options.db_path)
                ->default_value(options.db_path),
      "RocksDB directory for the ledger, chain heads and operations");

  auto chunking = po::options_description{"Chunking"};
  chunking.add_options()(
      "target-chunk-chars",
      po::value<std::size_t>(&options.limits.target_chunk_chars)
          ->default_value(options.limits.target_chunk_chars),
      "Preferred chunk length in bytes of text")(
      "max-unit-bytes",
      po::value<std::size_t>(&options.limits.max_unit_bytes)
          ->default_value(options.limits.max_unit_bytes),
      "Largest encoded ledger unit")(
      "min-chunk-chars",
      po::value<std::size_t>(&options.limits.min_chunk_chars)
          ->default_value(options.limits.min_chunk_chars),
      "Below this length, splitting ignores natural breaks")(
      "lookback-chars",
      po::value<std::size_t>(&options.limits.lookback_chars)
          ->default_value(options.limits.lookback_chars),
      "How far back to look for a natural break");

  auto publishing = po::options_description{"Publishing"};
  publishing.add_options()(
      "max-attempts",
      po::value<uint32_t>(&options.retry.max_attempts)
          ->default_value(options.retry.max_attempts),
      "Submission attempts per chunk")(
      "retry-delay-ms",
      po::value<uint64_t>()
          ->default_value(
              static_cast<uint64_t>(options.retry.retry_delay.count()))
          ->notifier(milliseconds_into(options.retry.retry_delay)),
      "Pause between attempts")(
      "submit-timeout-ms",
      po::value<uint64_t>()
          ->default_value(
              static_cast<uint64_t>(options.retry.submit_timeout.count()))
          ->notifier(milliseconds_into(options.retry.submit_timeout)),
      "How long to wait for one confirmation");

  auto feed = po::options_description{"Feed"};
  feed.add_options()(
      "limit-per-author",
      po::value<std::size_t>(&options.feed.limit_per_author)
          ->default_value(options.feed.limit_per_author),
      "Documents taken from each author")(
      "max-total",
      po::value<std::size_t>(&options.feed.max_total)
          ->default_value(options.feed.max_total),
      "Documents in the whole feed")(
      "cache-ttl-ms",
      po::value<uint64_t>()
          ->default_value(
              static_cast<uint64_t>(options.feed.cache_ttl.count()))
          ->notifier(milliseconds_into(options.feed.cache_ttl)),
      "How long a built feed is reused");

  auto identity = po::options_description{"Identity"};
  identity.add_options()(
      "network", po::value<std::string>(&options.network)
                     ->default_value(options.network),
      "Network name recorded in the root genesis")(
      "key-file", po::value<std::string>(&options.key_file)
                      ->default_value(options.key_file),
      "File holding the hex ed25519 seed used to sign");

  auto logging = po::options_description{"Logging"};
  logging.add_options()(
      "log-level", po::value<std::string>(&options.log_level)
                       ->default_value(options.log_level),
      "trace, debug, info, warn, error, critical or off")(
      "log-file", po::value<std::string>(&options.log_file),
      "Also log to this file");

  auto all = po::options_description{};
  all.add(storage)
      .add(chunking)
      .add(publishing)
      .add(feed)
      .add(identity)
      .add(logging);
  return all;
}

void validate(const options_t& options) {
  if (options.db_path.empty()) {
    throw invalid("--db must not be empty");
  }
  if (options.limits.target_chunk_chars == 0) {
    throw invalid("--target-chunk-chars must be positive");
  }
  if (options.limits.min_chunk_chars == 0) {
    throw invalid("--min-chunk-chars must be positive");
  }
  auto bare = options.limits;
  bare.envelope_overhead = glyphchain::ledger::chunk_unit_overhead({}, {}, {});
  if (!glyphchain::chunking::fits_unit(1, bare)) {
    throw invalid("--max-unit-bytes " +
                  std::to_string(options.limits.max_unit_bytes) +
                  " cannot hold the unit envelope");
  }
  if (options.retry.max_attempts == 0) {
    throw invalid("--max-attempts must be positive");
  }
  if (options.log_level != "off" &&
      spdlog::level::from_str(options.log_level) == spdlog::level::off) {
    throw invalid("unknown --log-level '" + options.log_level + "'");
  }
}

invocation_t parse(const int argc, const char* const argv[]) {
  auto result = invocation_t{};
  auto config_file = std::string{};

  auto generic = po::options_description{"Glyphchain"};
  generic.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(&config_file),
      "INI-style file with any of the options below")(
      "title,t", po::value<std::string>(&result.title),
      "Title of a published document")(
      "no-cache", "Rebuild the feed instead of reusing a cached one");

  auto settings = describe(result.options);

  auto hidden = po::options_description{};
  hidden.add_options()("command", po::value<std::string>(&result.command))(
      "arguments", po::value<std::vector<std::string>>(&result.arguments));

  auto positional = po::positional_options_description{};
  positional.add("command", 1).add("arguments", -1);

  auto command_line = po::options_description{};
  command_line.add(generic).add(settings).add(hidden);

  auto vm = po::variables_map{};
  po::store(po::command_line_parser(argc, argv)
                .options(command_line)
                .positional(positional)
                .run(),
            vm);
  if (vm.contains("config")) {
    po::store(po::parse_config_file<char>(
                  vm["config"].as<std::string>().c_str(), settings),
              vm);
  }
  po::notify(vm);

  result.help = vm.contains("help");
  if (vm.contains("no-cache")) {
    result.options.feed.use_cache = false;
  }

  auto usage = std::ostringstream{};
  usage << "Usage: glyphchain [options] <command> [arguments]\n\n"
        << "Commands:\n"
        << "  keygen <file>              write a new signing seed\n"
        << "  genesis-root               publish the platform root\n"
        << "  genesis-author <label>     anchor the signing identity\n"
        << "  publish <file>             publish a document (--title)\n"
        << "  resume <operation>         retry unpublished chunks\n"
        << "  status <operation>         show an operation\n"
        << "  operations                 list unfinished operations\n"
        << "  discard <operation>        drop an unfinished operation\n"
        << "  feed                       newest documents of all authors\n"
        << "  author <author> [limit]    newest documents of one author\n"
        << "  read <operation>           read a document by its manifest\n"
        << "  verify-genesis <unit>      check an author genesis unit\n\n"
        << generic << settings;
  result.usage = usage.str();

  if (!result.help) {
    validate(result.options);
  }
  return result;
}

}  // namespace glyphchain::config
