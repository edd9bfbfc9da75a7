#pragma once

namespace bytelocker {

    // Process-wide startup configuration
    struct Config {
        // Lock state given to buffers constructed without an explicit policy
        bool default_locked = false;
    };

    // Replace the process configuration. Affects only buffers constructed afterwards.
    void configure(const Config &config);

    [[nodiscard]] Config config();

    // Lock state a new buffer starts in. Resolved to a plain value when the policy is created,
    // so a later configure() never reaches buffers that already exist.
    class LockPolicy {
      public:
        static LockPolicy locked() { return LockPolicy(true); }
        static LockPolicy unlocked() { return LockPolicy(false); }
        static LockPolicy process_default() { return LockPolicy(config().default_locked); }

        [[nodiscard]] bool start_locked() const { return locked_; }

      private:
        explicit LockPolicy(bool locked) : locked_(locked) {}

        bool locked_;
    };

} // namespace bytelocker
