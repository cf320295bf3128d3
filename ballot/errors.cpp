#include "ballot/errors.hpp"

#include <sstream>

namespace ballot {

no_leader_error::no_leader_error(std::string const& prefix)
    : election_error("election has no leader, prefix=" + prefix) {
}

not_leader_error::not_leader_error(std::string const& what)
    : election_error(what) {
}

namespace {
std::string format_compacted(std::string const& what, std::int64_t compact_revision) {
  std::ostringstream os;
  os << what << " compact_revision=" << compact_revision;
  return os.str();
}
} // anonymous namespace

compacted_error::compacted_error(std::string const& what, std::int64_t compact_revision)
    : store_error(format_compacted(what, compact_revision), grpc::StatusCode::OUT_OF_RANGE)
    , compact_revision_(compact_revision) {
}

} // namespace ballot
