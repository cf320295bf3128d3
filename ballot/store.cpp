#include "ballot/store.hpp"

namespace ballot {
lease::~lease() noexcept(false) {
}

watcher::~watcher() noexcept(false) {
}

store::~store() noexcept(false) {
}
} // namespace ballot
