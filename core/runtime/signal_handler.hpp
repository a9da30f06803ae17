#pragma once

#include <atomic>

namespace tether
{
    namespace runtime
    {

        // Translates process signals into flags polled by the runtime loop
        //   SIGINT, SIGTERM -> shutdown (application exit hook)
        //   SIGUSR1         -> update pending (kill sidecar before binaries are replaced)
        class SignalHandler
        {
        public:
            static void install();

            static bool is_shutdown_requested();

            // Returns true once per SIGUSR1 received
            static bool consume_update_request();

            // Reset flags (tests)
            static void reset();

        private:
            static void handle_signal(int signal);
            static std::atomic<bool> shutdown_requested_;
            static std::atomic<bool> update_requested_;
        };

    } // namespace runtime
} // namespace tether
