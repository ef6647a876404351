#pragma once

#include "batch_processor.hpp"
#include "../utils/config/process_config_manager.hpp"
#include "../utils/constants.hpp"
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

namespace matching {

/**
 * Offchain Matcher Library
 *
 * Everything behind the offchain_matcher binary: argument parsing, config
 * and logging setup, payload input and exit code selection. Streams are
 * injected so a whole run can be driven in-process.
 *
 * Usage: offchain_matcher [--config <file>] [--status] [hex-payload]
 *   - payload from the positional argument, or stdin when absent
 *   - one JSON line on out: the notice or report record, or the status record
 *   - exit 0 on a notice or status, 1 on a report, 2 on a usage or config error
 */
class OffchainMatcherLib {
public:
    OffchainMatcherLib(std::istream& in, std::ostream& out, std::ostream& err);

    // argv[0] is the program name. Returns false when the run should stop
    // here; exit_code() then holds the code to return.
    bool initialize(const std::vector<std::string>& argv);

    int run();

    int exit_code() const { return exit_code_; }
    bool status_only() const { return status_only_; }
    const std::string& config_file() const { return config_file_; }

private:
    bool parse_arguments(const std::vector<std::string>& argv);
    bool usage_error(const std::string& message);
    void print_usage(std::ostream& stream) const;
    std::string read_payload() const;

    std::istream& in_;
    std::ostream& out_;
    std::ostream& err_;

    std::string program_{"offchain_matcher"};
    std::string config_file_;
    std::string payload_hex_;
    bool status_only_{false};
    int exit_code_{constants::cli::EXIT_NOTICE};

    config::ProcessConfigManager config_manager_;
    std::unique_ptr<BatchProcessor> processor_;
};

// initialize + run + logger shutdown. Returns the process exit code.
int run_offchain_matcher(const std::vector<std::string>& argv, std::istream& in, std::ostream& out,
                         std::ostream& err);

} // namespace matching
