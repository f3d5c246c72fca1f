#pragma once

#include "types.hpp"

#include <cstdint>
#include <string>
#include <vector>

// Greedy, order-preserving grouping of chapter archives under a size cap.
// A unit larger than the cap on its own becomes a singleton bundle.
class Bundler {
public:
    explicit Bundler(std::uint64_t capBytes);

    void add(ArchiveUnit unit);
    // Closes the open bundle and returns everything built so far.
    std::vector<Bundle> finish();

    static std::vector<Bundle> pack(std::vector<ArchiveUnit> units, std::uint64_t capBytes);

    // "<series> Ch.0001-0010.zip"
    static std::string bundle_name(const std::string& series, const Bundle& bundle);

private:
    std::uint64_t capBytes_;
    Bundle current_;
    std::vector<Bundle> closed_;
};
