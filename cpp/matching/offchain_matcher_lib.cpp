#include "offchain_matcher_lib.hpp"
#include "fee_model.hpp"
#include "../utils/logging/logger.hpp"
#include <iostream>
#include <iterator>

namespace matching {

namespace {

std::string trim(const std::string& value) {
    const size_t start = value.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    return value.substr(start, value.find_last_not_of(" \t\r\n") - start + 1);
}

} // namespace

OffchainMatcherLib::OffchainMatcherLib(std::istream& in, std::ostream& out, std::ostream& err)
    : in_(in), out_(out), err_(err) {
}

bool OffchainMatcherLib::usage_error(const std::string& message) {
    err_ << program_ << ": " << message << "\n";
    print_usage(err_);
    exit_code_ = constants::cli::EXIT_USAGE;
    return false;
}

void OffchainMatcherLib::print_usage(std::ostream& stream) const {
    stream << "Usage: " << program_ << " [--config <file>] [--status] [hex-payload]\n"
           << "  Reads the payload from stdin when no argument is given.\n"
           << "  Prints one JSON line; exits 0 on a notice, 1 on a report, 2 on a usage error.\n";
}

bool OffchainMatcherLib::parse_arguments(const std::vector<std::string>& argv) {
    if (!argv.empty()) {
        program_ = argv[0];
    }

    for (size_t i = 1; i < argv.size(); ++i) {
        const std::string& arg = argv[i];
        if (arg == "--config") {
            if (i + 1 >= argv.size()) {
                return usage_error("missing value for --config");
            }
            config_file_ = argv[++i];
        } else if (arg == "--status") {
            status_only_ = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage(out_);
            exit_code_ = constants::cli::EXIT_NOTICE;
            return false;
        } else if (arg.size() > 1 && arg[0] == '-') {
            return usage_error("unknown option " + arg);
        } else if (!payload_hex_.empty()) {
            return usage_error("more than one payload given");
        } else {
            payload_hex_ = arg;
        }
    }
    return true;
}

bool OffchainMatcherLib::initialize(const std::vector<std::string>& argv) {
    if (!parse_arguments(argv)) {
        return false;
    }

    if (!config_file_.empty() && !config_manager_.load_config(config_file_)) {
        err_ << "Cannot load config file " << config_file_ << std::endl;
        exit_code_ = constants::cli::EXIT_USAGE;
        return false;
    }
    config_manager_.apply_env_overrides(config::default_env_bindings());

    // out carries the result line only; logs go to stderr.
    logging::initialize_logging(config_manager_.get_log_file(),
                                logging::LogManager::level_from_string(
                                    config_manager_.get_string("logging", "level", "WARN")));

    processor_ = std::make_unique<BatchProcessor>(EngineDefaults::from_config(config_manager_));
    return true;
}

std::string OffchainMatcherLib::read_payload() const {
    if (!payload_hex_.empty()) {
        return trim(payload_hex_);
    }
    return trim(std::string(std::istreambuf_iterator<char>(in_), std::istreambuf_iterator<char>()));
}

int OffchainMatcherLib::run() {
    if (!processor_) {
        err_ << program_ << ": not initialized" << std::endl;
        exit_code_ = constants::cli::EXIT_USAGE;
        return exit_code_;
    }

    if (status_only_) {
        Json::StreamWriterBuilder builder;
        builder["indentation"] = "";
        out_ << Json::writeString(builder, processor_->status()) << std::endl;
        exit_code_ = constants::cli::EXIT_NOTICE;
        return exit_code_;
    }

    const RequestResult result = processor_->handle_request(read_payload());
    out_ << result.to_json_line() << std::endl;
    exit_code_ = result.is_notice() ? constants::cli::EXIT_NOTICE : constants::cli::EXIT_REPORT;
    return exit_code_;
}

int run_offchain_matcher(const std::vector<std::string>& argv, std::istream& in, std::ostream& out,
                         std::ostream& err) {
    OffchainMatcherLib matcher(in, out, err);
    const int exit_code = matcher.initialize(argv) ? matcher.run() : matcher.exit_code();
    logging::cleanup_logging();
    return exit_code;
}

} // namespace matching
