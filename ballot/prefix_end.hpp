#ifndef ballot_prefix_end_hpp
#define ballot_prefix_end_hpp
/**
 * @file
 *
 * Compute the end of a prefix range.
 */

#include <string>

namespace ballot {

/**
 * Returns the end of the key range that contains all the keys starting with @a prefix.
 *
 * etcd expresses multi-key reads and watches as half-open ranges [key, range_end).  The candidates in an election
 * are all the keys that start with the election prefix, which is the range [prefix, prefix + 1-bit).  This function
 * computes "prefix + 1-bit".
 *
 * @param prefix the beginning of the prefix range
 * @returns the end of the prefix range
 */
std::string prefix_end(std::string const& prefix);

} // namespace ballot

#endif // ballot_prefix_end_hpp
