#pragma once

#include <glyphchain/chunking/chunker.hpp>
#include <glyphchain/feed/reconstructor.hpp>
#include <glyphchain/ledger/ledger.hpp>

#include <boost/program_options.hpp>

#include <string>
#include <vector>

namespace glyphchain::config {

struct options final {
  std::string db_path{"glyphchain.db"};
  glyphchain::chunking::chunk_limits limits;
  glyphchain::ledger::retry_policy_t retry;
  glyphchain::feed::feed_options_t feed;
  std::string network{"localnet"};
  std::string key_file{"glyphchain.key"};
  std::string log_level{"info"};
  std::string log_file;
};

using options_t = options;

/// Everything the command line carried: settings plus the command to run.
struct invocation final {
  options_t options;
  std::string command;
  std::vector<std::string> arguments;
  std::string title;
  bool help{false};
  std::string usage;
};

using invocation_t = invocation;

/// Options that may appear both on the command line and in a config file,
/// bound to `options`.
boost::program_options::options_description describe(options_t& options);

/// Parse the command line and, when --config is given, the INI-style file it
/// names. Command-line values win over the file.
///
/// Throws boost::program_options::error for malformed input and
/// common::error (invalid_argument) for values that cannot work.
invocation_t parse(int argc, const char* const argv[]);

/// Throws common::error (invalid_argument).
void validate(const options_t& options);

}  // namespace glyphchain::config
