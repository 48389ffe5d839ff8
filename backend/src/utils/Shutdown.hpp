#pragma once

namespace tl::runtime
{

void request_shutdown() noexcept;
bool should_shutdown() noexcept;

// Routes SIGINT and SIGTERM to request_shutdown().
void install_signal_handlers();

} // namespace tl::runtime
