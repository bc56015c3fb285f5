#include "../include/logger.hpp"
#include "../include/tracked_map.hpp"
#include "../include/value.hpp"

#include <iostream>
#include <string>

namespace {

void PrintDirty(const tracked::TrackedMap<std::string, tracked::Value>& row) {
    std::cout << "  dirty: " << (row.IsDirty() ? "yes" : "no") << " {";
    bool first = true;
    for (const auto& entry : row.DirtySlice()) {
        std::cout << (first ? " " : ", ") << entry.first << " => "
                  << (entry.second ? entry.second->ToString() : "<removed>");
        first = false;
    }
    std::cout << " }" << std::endl;
}

}  // namespace

// Small walkthrough of dirty tracking on a row-like map
int main() {
    tracked::logger::LogConfig log_config;
    log_config.use_stdout = true;
    log_config.async_mode = false;
    log_config.min_level = tracked::logger::Level::DEBUG;
    tracked::logger::Logger::Instance().Configure(log_config);

    tracked::TrackedMapOptions options;
    options.name = "demo";
    options.log_transitions = true;

    tracked::TrackedMap<std::string, tracked::Value> row({{"a", 1}}, options);
    std::cout << "seeded with a => 1" << std::endl;
    PrintDirty(row);

    row.Set("a", 1);
    std::cout << "set a => 1 (same value)" << std::endl;
    PrintDirty(row);

    row.Set("b", 2);
    std::cout << "set b => 2" << std::endl;
    PrintDirty(row);

    row.Set("a", "hello");
    std::cout << "set a => \"hello\"" << std::endl;
    PrintDirty(row);

    row.Reset();
    std::cout << "reset" << std::endl;
    PrintDirty(row);

    row.Set("c", 3);
    std::cout << "set c => 3" << std::endl;
    PrintDirty(row);

    std::cout << "stored:";
    row.ForEach([](const std::string& key, const tracked::Value& value) {
        std::cout << " " << key << " => " << value.ToString();
    });
    std::cout << std::endl;

    TRACKED_LOG_INFO("demo finished with %zu dirty keys", row.DirtyCount());
    return 0;
}
