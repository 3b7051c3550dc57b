#ifndef KELVIN_OPTIONS
#define KELVIN_OPTIONS

#include <Kelvin/types.hpp>

namespace Kelvin {

    struct sync_options {
        // number of records an indexer returns in one page of history.
        constexpr static uint32 DefaultPageSize {25};

        // number of consecutive unused addresses after which
        // a keychain is considered exhausted.
        constexpr static uint32 DefaultBatchSize {10};

        // how many times we try to get an address history before
        // giving up and treating the address as empty.
        constexpr static uint32 DefaultFetchAttempts {2};

        uint32 PageSize {DefaultPageSize};

        uint32 BatchSize {DefaultBatchSize};

        uint32 FetchAttempts {DefaultFetchAttempts};

        // print progress to std::cout.
        bool Verbose {true};
    };
}

#endif
