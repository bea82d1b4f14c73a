#include <spdlog/async.h>
#include <spdlog/fmt/fmt.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <glyphchain/blake3/hash.hpp>
#include <glyphchain/chunking/chunker.hpp>
#include <glyphchain/common/error.hpp>
#include <glyphchain/compression/zlib.hpp>
#include <glyphchain/config/options.hpp>
#include <glyphchain/crypto/signer.hpp>
#include <glyphchain/feed/document_reader.hpp>
#include <glyphchain/feed/reconstructor.hpp>
#include <glyphchain/genesis/anchor.hpp>
#include <glyphchain/integrity/verifier.hpp>
#include <glyphchain/ledger/local_ledger.hpp>
#include <glyphchain/publishing/orchestrator.hpp>
#include <glyphchain/registry/chain_head_registry.hpp>
#include <glyphchain/storage/rocksdb/storage.hpp>

#include <cctype>
#include <charconv>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace {

using glyphchain::common::error;
using glyphchain::common::error_code;

constexpr auto kExitDomainError = 1;
constexpr auto kExitUsage = 2;

struct usage_error final : std::runtime_error {
  using std::runtime_error::runtime_error;
};

/// Every component, wired over one RocksDB store and the local ledger.
struct node final {
  explicit node(const glyphchain::config::options_t& options)
      : storage{glyphchain::storage::make_storage<
            glyphchain::storage::rocksdb_storage_tag>(options.db_path)},
        ledger{storage, options.limits.max_unit_bytes},
        registry{storage},
        chunker{glyphchain::blake3::make_hasher(),
                glyphchain::compression::make_zlib_compressor()},
        verifier{glyphchain::blake3::make_hasher()},
        orchestrator{ledger,
                     registry,
                     storage,
                     chunker,
                     verifier,
                     glyphchain::publishing::publish_config_t{
                         .limits = options.limits, .retry = options.retry}},
        reconstructor{registry, ledger, chunker},
        reader{ledger, chunker, verifier},
        anchor{ledger, registry, storage, glyphchain::blake3::make_hasher(),
               options.retry} {}

  glyphchain::storage::rocksdb_storage_t storage;
  glyphchain::ledger::local_ledger ledger;
  glyphchain::registry::chain_head_registry registry;
  glyphchain::chunking::chunker chunker;
  glyphchain::integrity::verifier verifier;
  glyphchain::publishing::orchestrator orchestrator;
  glyphchain::feed::reconstructor reconstructor;
  glyphchain::feed::document_reader reader;
  glyphchain::genesis::anchor anchor;
};

void setup_logging(const glyphchain::config::options_t& options) {
  spdlog::init_thread_pool(8192, 1);

  auto sinks = std::vector<spdlog::sink_ptr>{
      std::make_shared<spdlog::sinks::stdout_color_sink_mt>()};
  if (!options.log_file.empty()) {
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
        options.log_file, false));
  }

  auto logger = std::make_shared<spdlog::async_logger>(
      "glyphchain", sinks.begin(), sinks.end(), spdlog::thread_pool(),
      spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::from_str(options.log_level));
}

const std::string& argument(const glyphchain::config::invocation_t& call,
                            const std::size_t index,
                            const std::string_view name) {
  if (index >= call.arguments.size()) {
    throw usage_error{fmt::format("{} needs <{}>", call.command, name)};
  }
  return call.arguments[index];
}

std::size_t count_argument(const std::string& text) {
  auto value = std::size_t{};
  auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || end != text.data() + text.size() || value == 0) {
    throw usage_error{fmt::format("'{}' is not a positive count", text)};
  }
  return value;
}

std::string read_file(const std::string& path) {
  auto in = std::ifstream{path, std::ios::binary};
  if (!in) {
    throw error{error_code::not_found, "cannot read " + path};
  }
  return {std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
}

glyphchain::crypto::signer_t load_signer(const std::string& key_file) {
  auto text = read_file(key_file);
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
    text.pop_back();
  }
  auto seed = glyphchain::crypto::try_parse_seed(text);
  if (!seed) {
    throw error{error_code::invalid_argument,
                key_file + " does not hold a 64 character hex seed"};
  }
  auto signer = glyphchain::crypto::make_ed25519_signer(*seed);
  if (!signer) {
    throw error{error_code::invalid_argument,
                "cannot build an ed25519 key from " + key_file};
  }
  return *signer;
}

void print_status(const glyphchain::publishing::publish_status_t& status) {
  fmt::print("operation {}\n  author   {}\n  stage    {}\n  progress {}%\n"
             "  chunks   {} confirmed, {} failed, {} pending of {}\n",
             status.operation_id, status.author_id,
             glyphchain::schema::to_string(status.stage), status.progress,
             status.confirmed, status.failed, status.pending,
             status.total_chunks);
  if (!status.error.empty()) {
    fmt::print("  error    {}\n", status.error);
  }
  for (auto i = std::size_t{0}; i < status.chunk_statuses.size(); ++i) {
    const auto& chunk = status.chunk_statuses[i];
    fmt::print("  [{}] {} {}{}\n", i, glyphchain::schema::to_string(chunk.state),
               chunk.unit_id.value_or("-"),
               chunk.reason.empty() ? "" : " (" + chunk.reason + ")");
  }
}

void print_entries(const std::vector<glyphchain::schema::feed_entry_t>& entries) {
  for (const auto& entry : entries) {
    fmt::print("== {} | {} | {} | {}\n{}\n\n", entry.timestamp,
               entry.author_id, entry.title.empty() ? "(untitled)" : entry.title,
               entry.unit_id, entry.body);
  }
  if (entries.empty()) {
    fmt::print("(no documents)\n");
  }
}

int keygen(const glyphchain::config::invocation_t& call) {
  const auto& path = argument(call, 0, "file");
  if (std::filesystem::exists(path)) {
    throw error{error_code::invalid_argument, path + " already exists"};
  }
  auto seed = glyphchain::crypto::generate_ed25519_seed();
  auto signer = glyphchain::crypto::make_ed25519_signer(seed);
  if (!signer) {
    throw error{error_code::invalid_argument, "OpenSSL refused the new key"};
  }
  auto out = std::ofstream{path, std::ios::trunc};
  out << glyphchain::schema::to_hex(
             glyphchain::schema::bytes_view_t{seed.data(), seed.size()})
      << '\n';
  if (!out) {
    throw error{error_code::invalid_argument, "cannot write " + path};
  }
  fmt::print("{}\n", signer->public_identity);
  return 0;
}

int dispatch(const glyphchain::config::invocation_t& call) {
  const auto& options = call.options;
  const auto& command = call.command;
  if (command == "keygen") {
    return keygen(call);
  }

  auto app = node{options};

  if (command == "genesis-root") {
    auto root = app.anchor.publish_root(load_signer(options.key_file),
                                        options.network);
    fmt::print("root {}\n  network  {}\n  hash     {}\n", root.unit_id,
               root.genesis.network,
               glyphchain::schema::to_hex(root.genesis.genesis_hash));
    return 0;
  }
  if (command == "genesis-author") {
    auto record = app.anchor.publish_author_genesis(
        load_signer(options.key_file), argument(call, 0, "label"));
    fmt::print("author genesis {}\n  author   {}\n  root     {}\n  hash     {}\n",
               record.author_genesis_id, record.author_public_identity,
               record.root_id, glyphchain::schema::to_hex(record.derived_hash));
    return 0;
  }
  if (command == "publish") {
    auto signer = load_signer(options.key_file);
    auto document = read_file(argument(call, 0, "file"));
    auto id = app.orchestrator.create_publish_operation(signer, call.title,
                                                        document);
    auto status = app.orchestrator.publish(
        id, signer, [](const glyphchain::publishing::publish_status_t& s) {
          spdlog::info("{}: {} {}%", s.operation_id,
                       glyphchain::schema::to_string(s.stage), s.progress);
        });
    print_status(status);
    return status.stage == glyphchain::schema::publish_stage_t::completed
               ? 0
               : kExitDomainError;
  }
  if (command == "resume") {
    auto status = app.orchestrator.resume(argument(call, 0, "operation"),
                                          load_signer(options.key_file));
    print_status(status);
    return status.stage == glyphchain::schema::publish_stage_t::completed
               ? 0
               : kExitDomainError;
  }
  if (command == "status") {
    const auto& id = argument(call, 0, "operation");
    auto status = app.orchestrator.get_status(id);
    if (!status) {
      throw error{error_code::not_found, "no operation " + id};
    }
    print_status(*status);
    return 0;
  }
  if (command == "operations") {
    auto operations = app.orchestrator.list_operations();
    for (const auto& status : operations) {
      fmt::print("{} {} {} {}/{}\n", status.operation_id, status.author_id,
                 glyphchain::schema::to_string(status.stage), status.confirmed,
                 status.total_chunks);
    }
    if (operations.empty()) {
      fmt::print("(no unfinished operations)\n");
    }
    return 0;
  }
  if (command == "discard") {
    const auto& id = argument(call, 0, "operation");
    if (!app.orchestrator.discard(id)) {
      throw error{error_code::not_found, "no discardable operation " + id};
    }
    fmt::print("discarded {}\n", id);
    return 0;
  }
  if (command == "feed") {
    print_entries(app.reconstructor.build_feed(options.feed));
    return 0;
  }
  if (command == "author") {
    auto limit = call.arguments.size() > 1 ? count_argument(call.arguments[1])
                                           : options.feed.limit_per_author;
    print_entries(app.reconstructor.get_units_for_author(
        argument(call, 0, "author"), limit));
    return 0;
  }
  if (command == "read") {
    const auto& id = argument(call, 0, "operation");
    auto manifest = app.orchestrator.get_manifest(id);
    if (!manifest) {
      throw error{error_code::not_found, "no completed operation " + id};
    }
    fmt::print("{}\n", app.reader.read(*manifest));
    return 0;
  }
  if (command == "verify-genesis") {
    auto record = app.anchor.read_author_genesis(argument(call, 0, "unit"));
    fmt::print("valid author genesis {}\n  author   {}\n  label    {}\n"
               "  root     {}\n",
               record.author_genesis_id, record.author_public_identity,
               record.label, record.root_id);
    return 0;
  }
  throw usage_error{fmt::format("unknown command '{}'", command)};
}

}  // namespace

int main(int argc, char* argv[]) {
  auto call = glyphchain::config::invocation_t{};
  try {
    call = glyphchain::config::parse(argc, argv);
  } catch (const boost::program_options::error& e) {
    std::cerr << e.what() << "\n";
    return kExitUsage;
  } catch (const error& e) {
    std::cerr << e.what() << "\n";
    return kExitUsage;
  }

  if (call.help || call.command.empty()) {
    std::cout << call.usage << std::endl;
    return call.help ? 0 : kExitUsage;
  }

  setup_logging(call.options);

  auto code = 0;
  try {
    code = dispatch(call);
  } catch (const usage_error& e) {
    spdlog::error("{}", e.what());
    std::cerr << call.usage << std::endl;
    code = kExitUsage;
  } catch (const error& e) {
    spdlog::error("{}", e.what());
    code = kExitDomainError;
  } catch (const std::exception& e) {
    spdlog::error("unexpected failure: {}", e.what());
    code = kExitDomainError;
  }

  spdlog::shutdown();
  return code;
}
