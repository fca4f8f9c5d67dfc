// Example: Running a small SAMS shard cluster
//
// Usage: sharding_demo [config.yaml]
// Without a configuration file three in-memory shards are started.

#include "sharding/shard_manager.h"
#include "utils/logger.h"
#include <iostream>

using namespace sams;

int main(int argc, char** argv) {
    try {
        sharding::ShardingConfig config;
        if (argc > 1) {
            config = sharding::ShardingConfig::loadFromYaml(argv[1]);
        } else {
            config.health_check.enabled = false;
            for (const auto& id : {"shard_001", "shard_002", "shard_003"}) {
                sharding::ShardingConfig::ShardEntry entry;
                entry.id = id;
                entry.connection.database = id;
                config.shards.push_back(entry);
            }
            config.shard_keys.push_back({"alerts", "server_id", sharding::ShardingAlgorithm::HASH});
        }

        if (config.logging.file.empty()) {
            utils::Logger::initConsole(utils::Logger::levelFromString(config.logging.level));
        } else {
            utils::Logger::init(config.logging.file, utils::Logger::levelFromString(config.logging.level));
        }

        std::cout << "=== SAMS Shard Manager Demo ===" << std::endl;

        sharding::ShardManager manager(config);
        manager.applyTopology(config);

        // 1. Write alerts for a fleet of servers
        for (int i = 1; i <= 100; ++i) {
            std::string server = "srv-" + std::to_string(i);
            manager.distributeData("alerts", {
                {"server_id", server},
                {"severity", i % 10 == 0 ? "critical" : "warning"}
            });
        }

        // 2. Look one server up on its owning shard
        std::cout << "srv-42 lives on " << manager.getShardForKey("srv-42") << std::endl;
        auto keyed = manager.queryShardByKey("srv-42", "SELECT * FROM alerts WHERE server_id = ?", {"srv-42"});
        std::cout << "Alerts for srv-42: " << keyed.row_count << std::endl;

        // 3. Ask every shard
        auto critical = manager.queryAllShards("SELECT * FROM alerts WHERE severity = 'critical'");
        std::cout << "Critical alerts cluster-wide: " << critical.row_count << std::endl;

        // 4. Drain one shard
        auto ids = manager.getShardIds();
        if (ids.size() > 1) {
            auto migration = manager.removeShard(ids.back());
            std::cout << "Removed " << ids.back() << ": " << migration.toJson().dump() << std::endl;
            std::cout << "Alerts after removal: "
                      << manager.queryAllShards("SELECT * FROM alerts").row_count << std::endl;
        }

        // 5. Rebalance and report
        manager.rebalance();
        if (auto report = manager.waitForRebalance()) {
            std::cout << "Rebalance: " << report->toJson().dump() << std::endl;
        }

        std::cout << "Statistics: " << manager.getShardStatistics().toJson().dump(2) << std::endl;
        std::cout << "Configuration: " << config.toJson().dump(2) << std::endl;
        std::cout << manager.metrics().getMetrics();

        utils::Logger::shutdown();
        return 0;
    } catch (const sharding::ShardingError& e) {
        std::cerr << "Error (" << sharding::errorCodeToString(e.code()) << "): " << e.what() << std::endl;
        return 1;
    }
}
