#ifndef ballot_detail_wait_for_delete_hpp
#define ballot_detail_wait_for_delete_hpp

#include <ballot/store.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace ballot {
namespace detail {

/// How often the waiters check the stop flag.
constexpr std::chrono::milliseconds stop_poll_period(50);

/**
 * Block until @a key is deleted.
 *
 * The watch starts at @a start_revision, normally one past the revision of the read that found the key, so a delete
 * that races with the read is still delivered.  If that part of the history is compacted the key is read again, and
 * the watch restarts after that read.  A key created at or after @a start_revision is a different instance, the one
 * we waited on is already gone.
 *
 * @param s the store holding the key.
 * @param key the key to wait on.
 * @param start_revision the first revision of interest.
 * @param stop if not null, the function gives up once this flag is set.
 * @returns true if the key was deleted, false if the wait was stopped.
 * @throws ballot::store_error if the watch fails.
 */
bool wait_for_delete(
    store& s, std::string const& key, std::int64_t start_revision, std::atomic<bool> const* stop = nullptr);

/**
 * Block until all the @a keys are deleted, in order.
 *
 * The keys are the result of a single read, and @a start_revision is one past the revision of that read.  All the
 * watches start there, so a key deleted and created again after the read is not confused with the one listed.  Keys
 * that are already gone, or were created again, are skipped without creating a watch.
 *
 * @returns true if all the keys were deleted, false if the wait was stopped.
 */
bool wait_for_deletes(
    store& s, std::vector<std::string> const& keys, std::int64_t start_revision,
    std::atomic<bool> const* stop = nullptr);

} // namespace detail
} // namespace ballot

#endif // ballot_detail_wait_for_delete_hpp
