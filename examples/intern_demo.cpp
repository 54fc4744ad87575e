/**
 * @file intern_demo.cpp
 * @brief Interns a batch of identifiers from several threads, then sweeps
 *
 * Usage: intern_demo [config-file]
 */

#include "hashcons/config.hpp"
#include "hashcons/intern.hpp"

#include <iostream>
#include <string>
#include <thread>
#include <vector>

namespace {

struct Identifier {
    std::string module;
    std::string name;

    bool operator==(const Identifier&) const = default;
};

void hashAppend(hashcons::Hasher& h, const Identifier& id) {
    hashAppend(h, id.module);
    hashAppend(h, id.name);
}

std::ostream& operator<<(std::ostream& os, const Identifier& id) {
    return os << id.module << ':' << id.name;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc > 1 && !hashcons::InternConfig::instance().init(argv[1])) {
        std::cerr << "[intern_demo] No config at " << argv[1] << ", using defaults\n";
    }

    const std::vector<std::string> names = {"stone", "dirt", "grass", "stone", "dirt"};

    std::vector<std::vector<hashcons::Interned<Identifier>>> results(4);
    std::vector<std::thread> threads;
    for (size_t t = 0; t < results.size(); ++t) {
        threads.emplace_back([&names, &results, t]() {
            for (const auto& name : names) {
                results[t].push_back(hashcons::intern(Identifier{"blockgame", name}));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    std::cout << "interned " << names.size() * results.size() << " values into "
              << hashcons::size<Identifier>() << " slots\n";
    std::cout << "first: " << results[0].front()
              << " (holders: " << results[0].front().useCount() << ")\n";

    // Keep one handle, drop the rest
    auto kept = results[0].front();
    results.clear();

    size_t reclaimed = hashcons::gc();
    std::cout << "gc reclaimed " << reclaimed << ", "
              << hashcons::size<Identifier>() << " live (" << kept << ")\n";

    return 0;
}
