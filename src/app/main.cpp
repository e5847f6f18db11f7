/*
 * Copyright (C) 2025 Emeric Poupon
 *
 * This file is part of Podkeep.
 *
 * Podkeep is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * Podkeep is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with Podkeep.  If not, see <http://www.gnu.org/licenses/>.
 */

#include <clocale>
#include <csignal>
#include <future>
#include <iostream>
#include <limits>
#include <optional>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "core/Exception.hpp"
#include "core/IConfig.hpp"
#include "core/ILogger.hpp"
#include "core/IOContextRunner.hpp"
#include "core/Service.hpp"
#include "core/http/IClient.hpp"
#include "database/IDb.hpp"
#include "database/Session.hpp"
#include "services/downloads/IConsumptionOracle.hpp"
#include "services/downloads/IDiscoveryService.hpp"
#include "services/downloads/IDownloadService.hpp"
#include "services/downloads/IFileSystemPlanner.hpp"
#include "services/downloads/IRetentionService.hpp"
#include "services/downloads/IScheduler.hpp"
#include "services/downloads/Jobs.hpp"

namespace podkeep
{
    namespace
    {
        constexpr std::string_view defaultConfigFilePath{ "/etc/podkeep.conf" };

        core::logging::Severity getLogMinSeverity(core::IConfig& config)
        {
            const std::string_view value{ config.getString("log-min-severity", "info") };
            if (const std::optional<core::logging::Severity> severity{ core::logging::parseSeverity(value) })
                return *severity;

            throw core::PodkeepException{ "Invalid config value for 'log-min-severity': '" + std::string{ value } + "'" };
        }

        unsigned long getBoundedULong(std::string_view setting, unsigned long def, unsigned long min, unsigned long max)
        {
            const unsigned long value{ core::Service<core::IConfig>::get()->getULong(setting, def) };
            if (value < min || value > max)
                throw core::PodkeepException{ "Invalid config value for '" + std::string{ setting } + "': must be in [" + std::to_string(min) + ", " + std::to_string(max) + "]" };

            return value;
        }

        std::chrono::seconds getInterval(std::string_view setting, unsigned long def, unsigned long min)
        {
            return std::chrono::seconds{ getBoundedULong(setting, def, min, std::numeric_limits<long>::max()) };
        }

        db::IntegrityCheck getDbIntegrityCheck()
        {
            std::string_view check{ core::Service<core::IConfig>::get()->getString("db-integrity-check", "quick") };

            if (check == "none")
                return db::IntegrityCheck::None;
            else if (check == "quick")
                return db::IntegrityCheck::Quick;
            else if (check == "full")
                return db::IntegrityCheck::Full;

            throw core::PodkeepException{ "Invalid config value for 'db-integrity-check'" };
        }

        downloads::DownloadServiceParameters getDownloadServiceParameters()
        {
            downloads::DownloadServiceParameters params;
            params.maxConcurrentTransfers = getBoundedULong("max-concurrent-downloads", 3, 1, 10);
            params.transferTimeout = getInterval("download-timeout", 3600, 1);
            return params;
        }

        downloads::JobParameters getJobParameters()
        {
            core::IConfig& config{ *core::Service<core::IConfig>::get() };

            downloads::JobParameters params;
            params.feedRefreshInterval = getInterval("feed-refresh-interval", 3600, 300);
            params.queueProcessingInterval = getInterval("queue-process-interval", 300, 1);
            params.retryInterval = getInterval("retry-interval", 3600, 1);
            params.maxRetries = config.getULong("max-retries", 3);
            params.retentionEnabled = config.getBool("auto-cleanup", true);
            params.retentionInterval = getInterval("cleanup-interval", 86400, 3600);
            params.diskSpaceCheckInterval = getInterval("disk-space-check-interval", 3600, 60);
            return params;
        }

        std::unique_ptr<downloads::IConsumptionOracle> createConsumptionOracle(core::http::IClient& httpClient)
        {
            core::IConfig& config{ *core::Service<core::IConfig>::get() };

            if (!config.getBool("plex-enabled", false))
                return nullptr;

            downloads::PlexParameters params;
            params.url = config.getString("plex-url", "");
            params.token = config.getString("plex-token", "");
            params.libraryName = config.getString("plex-library", "Podcasts");

            if (params.url.empty() || params.token.empty() || params.libraryName.empty())
            {
                PODKEEP_LOG(MAIN, WARNING, "Plex enabled but 'plex-url', 'plex-token' or 'plex-library' is missing, using count based cleanup");
                return nullptr;
            }

            while (!params.url.empty() && params.url.back() == '/')
                params.url.pop_back();

            return downloads::createPlexConsumptionOracle(httpClient, params);
        }
    } // namespace

    int main(int argc, char* argv[])
    {
        std::filesystem::path configFilePath{ defaultConfigFilePath };
        int res{ EXIT_FAILURE };

        auto displayUsage{ [&](std::ostream& os) {
            os << "Usage:\t" << (argc > 0 ? argv[0] : "podkeep") << "\t[conf_file]\n\n"
               << "Options:\n"
               << "\tconf_file:\t path to the Podkeep configuration file (defaults to " << configFilePath << ")\n\n";
        } };

        if (argc == 2)
        {
            const std::string_view arg{ argv[1] };
            if (arg == "-h" || arg == "--help")
            {
                displayUsage(std::cout);
                return EXIT_SUCCESS;
            }
            configFilePath = std::string(arg, 0, 256);
        }
        else if (argc > 2)
        {
            displayUsage(std::cerr);
            return EXIT_FAILURE;
        }

        try
        {
            core::Service<core::IConfig> config{ core::createConfig(configFilePath) };
            core::Service<core::logging::ILogger> logger{ core::logging::createLogger(getLogMinSeverity(*config), config->getPath("log-file", "")) };

            // use system locale, for the file names
            if (char* locale{ ::setlocale(LC_ALL, "") })
                PODKEEP_LOG(MAIN, INFO, "locale set to '" << locale << "'");
            else
                PODKEEP_LOG(MAIN, WARNING, "Cannot set locale from system");

            const std::filesystem::path workingDir{ config->getPath("working-dir", "/var/podkeep") };
            std::filesystem::create_directories(workingDir);

            const downloads::DownloadServiceParameters downloadServiceParameters{ getDownloadServiceParameters() };
            const downloads::JobParameters jobParameters{ getJobParameters() };

            boost::asio::io_context ioContext;
            core::IOContextRunner ioContextRunner{ ioContext, 2, "Main" };

            // transfers, scheduled jobs and this thread may all access the database
            db::DbParameters dbParameters;
            dbParameters.connectionCount = downloadServiceParameters.maxConcurrentTransfers + 6;
            dbParameters.integrityCheck = getDbIntegrityCheck();
            dbParameters.showQueries = config->getBool("db-show-queries", false);
            auto database{ db::createDb(workingDir / "podkeep.db", dbParameters) };
            {
                db::Session session{ *database };
                session.prepareSchemaIfNeeded();
            }

            // Service initialization order is important (reverse-order for deinit)
            const std::unique_ptr<core::http::IClient> httpClient{ core::http::createClient(ioContext) };
            const std::unique_ptr<downloads::IFileSystemPlanner> planner{ downloads::createFileSystemPlanner(config->getPath("download-path", "/var/podkeep/downloads")) };

            const std::unique_ptr<downloads::IDownloadService> downloadService{ downloads::createDownloadService(*database, *planner, *httpClient, downloadServiceParameters) };
            downloadService->recoverInterruptedDownloads();

            const std::unique_ptr<downloads::IConsumptionOracle> consumptionOracle{ createConsumptionOracle(*httpClient) };
            const std::unique_ptr<downloads::IRetentionService> retentionService{ downloads::createRetentionService(*database, *planner, consumptionOracle.get()) };
            const std::unique_ptr<downloads::IDiscoveryService> discoveryService{ downloads::createDiscoveryService(*database, *planner, *downloadService, nullptr) };

            const std::unique_ptr<downloads::IScheduler> scheduler{ downloads::createScheduler(ioContext) };
            downloads::registerJobs(*scheduler, downloads::JobServices{ *discoveryService, *downloadService, *retentionService, *planner }, jobParameters);

            std::promise<int> stopSignal;
            boost::asio::signal_set signals{ ioContext, SIGINT, SIGTERM, SIGQUIT };
            signals.async_wait([&](const boost::system::error_code& ec, int signo) {
                if (ec)
                    return;

                stopSignal.set_value(signo);
            });

            scheduler->start();

            PODKEEP_LOG(MAIN, INFO, "Now running...");
            const int signo{ stopSignal.get_future().get() };
            PODKEEP_LOG(MAIN, INFO, "Caught signal " << signo << ", stopping...");

            // ongoing transfers are put back in the queue
            downloadService->shutdown();
            scheduler->stop();
            httpClient->abortAllRequests();

            ioContextRunner.stop();

            PODKEEP_LOG(MAIN, INFO, "Quitting...");
            res = EXIT_SUCCESS;
        }
        catch (const std::exception& e)
        {
            PODKEEP_LOG(MAIN, FATAL, "Caught std::exception: " << e.what());
            std::cerr << "Caught std::exception: " << e.what() << std::endl;
            res = EXIT_FAILURE;
        }

        return res;
    }
} // namespace podkeep

int main(int argc, char* argv[])
{
    return podkeep::main(argc, argv);
}
