#ifndef ballot_assert_throw_hpp
#define ballot_assert_throw_hpp
/**
 * @file
 *
 * Define a macro to check internal invariants at runtime.
 */

#ifndef BALLOT_ASSERT_THROW
/**
 * Check the predicate @a P and raise an exception describing the problem if it is false.
 *
 * Used for conditions that indicate a bug in the library or a store that violates its contract, e.g. a failed
 * transaction without the response it should carry.
 */
#define BALLOT_ASSERT_THROW(P)                                                                                         \
  do {                                                                                                                 \
    if (not(P)) {                                                                                                      \
      ballot::assert_throw_impl(#P, __func__, __FILE__, __LINE__);                                                     \
    }                                                                                                                  \
  } while (false)
#endif // BALLOT_ASSERT_THROW

namespace ballot {

/**
 * Implement the @c BALLOT_ASSERT_THROW macro out-of-line.
 *
 * @param what the text of the predicate
 * @param function the function where the predicate was asserted.
 * @param filename the source file where the predicate was asserted.
 * @param lineno the line where the predicate was asserted.
 * @throws std::runtime_error always.
 */
[[noreturn]] void assert_throw_impl(char const* what, char const* function, char const* filename, int lineno);
} // namespace ballot

#endif // ballot_assert_throw_hpp
