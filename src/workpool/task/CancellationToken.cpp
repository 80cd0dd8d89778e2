#include "CancellationToken.hpp"

namespace WP {

namespace {
thread_local CancellationToken const* currentTaskToken = nullptr;
} // namespace

namespace this_task {

bool stopRequested() {
    return currentTaskToken != nullptr && currentTaskToken->stopRequested();
}

CancellationToken const* currentToken() {
    return currentTaskToken;
}

} // namespace this_task

namespace detail {

CurrentTokenScope::CurrentTokenScope(CancellationToken const* token) : previous(currentTaskToken) {
    currentTaskToken = token;
}

CurrentTokenScope::~CurrentTokenScope() {
    currentTaskToken = previous;
}

} // namespace detail

} // namespace WP
