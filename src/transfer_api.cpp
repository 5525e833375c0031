#include "transfer_api.hpp"
#include "remote_transfer.hpp"
#include "transfer_log.hpp"
#include <exception>
#include <memory>

std::expected<RunSummary, std::string> TransferAPI::run(const std::string& configFile) {
    TransferConfig config;
    try {
        config = TransferConfig::fromFile(configFile);
    } catch (const std::exception& e) {
        return std::unexpected(std::string("Failed to load config: ") + e.what());
    }

    auto logger = makeLogger(config.logging);
    try {
        const RemoteDestination& dest = config.destination;
        logger->info("sftptransfer started. Source: " + config.sourceDir.string() + ", Destination: " + dest.user +
                     "@" + dest.host + ":" + dest.remoteDir + " on Port " + std::to_string(dest.port));

        BatchProcessor processor(config, std::make_unique<SFTPTransferStrategy>(dest), *logger);
        auto result = processor.run();
        if (!result) {
            return std::unexpected(result.error().describe());
        }
        return std::move(*result);
    } catch (const std::exception& e) {
        logger->critical(std::string("Unhandled exception: ") + e.what());
        return std::unexpected(std::string("Unhandled exception: ") + e.what());
    }
}
