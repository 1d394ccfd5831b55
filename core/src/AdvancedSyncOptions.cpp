#include "AdvancedSyncOptions.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace DriveSync {

namespace {

bool isNumber(const std::string& value, double& parsed) {
    try {
        size_t used = 0;
        parsed = std::stod(value, &used);
        return used == value.size();
    } catch (const std::logic_error&) {
        return false;
    }
}

bool isInteger(const std::string& value, long long& parsed) {
    try {
        size_t used = 0;
        parsed = std::stoll(value, &used);
        return used == value.size();
    } catch (const std::logic_error&) {
        return false;
    }
}

bool isBoolean(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    static const char* kAccepted[] = {"1", "0", "true", "false", "yes", "no", "on", "off"};
    for (const char* accepted : kAccepted) {
        if (value == accepted) return true;
    }
    return false;
}

} // namespace

Result<void> AdvancedSyncOptions::validate() const {
    if (bandwidthLimitMbps < 0.0) {
        return Err(ErrorCode::InvalidArgument, "Bandwidth limit must not be negative");
    }
    if (compressionEnabled && compressionAlgorithm == CompressionAlgorithm::Gzip &&
        (compressionLevel < GzipCompressor::MIN_LEVEL || compressionLevel > GzipCompressor::MAX_LEVEL)) {
        return Err(ErrorCode::InvalidArgument, "Compression level must be between 1 and 9");
    }
    if (parallelFiles == 0) {
        return Err(ErrorCode::InvalidArgument, "Parallel file count must be at least 1");
    }
    if (encryptionEnabled) {
        if (encryptionPassword.empty() && encryptionKeyFile.empty()) {
            return Err(ErrorCode::InvalidArgument, "Encryption needs a password or a key file");
        }
        if (!encryptionPassword.empty() && !encryptionKeyFile.empty()) {
            return Err(ErrorCode::InvalidArgument, "Specify either an encryption password or a key file, not both");
        }
    }
    return Ok();
}

std::unordered_map<std::string, Config::Validator> AdvancedSyncOptions::configSchema(const std::string& prefix) {
    auto boolean = [](const std::string&, const std::string& value) { return isBoolean(value); };
    return {
        {prefix + "bandwidth_limit_mbps", [](const std::string&, const std::string& value) {
            double parsed = 0;
            return isNumber(value, parsed) && parsed >= 0.0;
        }},
        {prefix + "compression_level", [](const std::string&, const std::string& value) {
            long long parsed = 0;
            return isInteger(value, parsed) && parsed >= GzipCompressor::MIN_LEVEL && parsed <= GzipCompressor::MAX_LEVEL;
        }},
        {prefix + "compression_algorithm", [](const std::string&, const std::string& value) {
            return parseCompressionAlgorithm(value).has_value();
        }},
        {prefix + "parallel_files", [](const std::string&, const std::string& value) {
            long long parsed = 0;
            return isInteger(value, parsed) && parsed >= 1 && parsed <= 64;
        }},
        {prefix + "size_tolerance", [](const std::string&, const std::string& value) {
            long long parsed = 0;
            return isInteger(value, parsed) && parsed >= 0;
        }},
        {prefix + "encryption", boolean},
        {prefix + "compression", boolean},
        {prefix + "incremental", boolean},
        {prefix + "space_savings", boolean},
    };
}

Result<AdvancedSyncOptions> AdvancedSyncOptions::fromConfig(const Config& config, const std::string& prefix) {
    std::string failedKey;
    if (!config.validate(configSchema(prefix), &failedKey)) {
        return Err<AdvancedSyncOptions>(ErrorCode::ConfigError,
                                        "Invalid value for " + failedKey + ": '" + config.get(failedKey) + "'");
    }

    AdvancedSyncOptions options;
    options.bandwidthLimitMbps = config.getDouble(prefix + "bandwidth_limit_mbps", 0.0);
    options.encryptionEnabled = config.getBool(prefix + "encryption", false);
    options.encryptionPassword = config.get(prefix + "encryption_password");
    options.encryptionKeyFile = config.get(prefix + "encryption_key_file");
    options.compressionEnabled = config.getBool(prefix + "compression", false);
    options.compressionAlgorithm = parseCompressionAlgorithm(config.get(prefix + "compression_algorithm", "gzip"))
                                       .value_or(CompressionAlgorithm::Gzip);
    options.compressionLevel = config.getInt(prefix + "compression_level", GzipCompressor::DEFAULT_LEVEL);
    options.parallelFiles = config.getSize(prefix + "parallel_files", 1);
    options.incremental = config.getBool(prefix + "incremental", true);
    options.excludePatterns = config.getList(prefix + "exclude");
    options.sizeTolerance = config.getSize(prefix + "size_tolerance", 0);
    options.calculateSpaceSavings = config.getBool(prefix + "space_savings", true);

    if (options.compressionAlgorithm == CompressionAlgorithm::None) {
        options.compressionEnabled = false;
    }

    auto valid = options.validate();
    if (!valid) {
        return Err<AdvancedSyncOptions>(ErrorCode::ConfigError, valid.error().message);
    }
    return options;
}

} // namespace DriveSync
