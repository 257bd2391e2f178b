#ifndef CACHEOPTIONS_HPP
#define CACHEOPTIONS_HPP

#include <chrono>
#include <cstddef>
#include <optional>

// Decides which expiry governs a key that is set again before its previous
// TTL has elapsed. The value itself is always replaced.
enum class OverwritePolicy {
    AlwaysReplace, // the new TTL wins, even when it is shorter
    KeepLongest    // the later of the old and new expiry instants wins
};

struct CacheOptions {
    // Soft bound on the number of resident entries. Unbounded when empty.
    std::optional<std::size_t> capacity;

    // Expiry instants are rounded down to this granularity so that entries
    // set close together share an instant.
    std::chrono::milliseconds expiry_granularity{10};

    OverwritePolicy overwrite_policy = OverwritePolicy::AlwaysReplace;
};

#endif // CACHEOPTIONS_HPP
