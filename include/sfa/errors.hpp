#pragma once

#include <stdexcept>
#include <string>

namespace sfa {

    // Recursion guardrails; always raised before any side effect
    class guardrail_error : public std::runtime_error {
      public:
        using std::runtime_error::runtime_error;
    };

    class depth_exceeded_error : public guardrail_error {
      public:
        depth_exceeded_error(int depth, int max_depth);

        int depth() const noexcept { return depth_; }
        int max_depth() const noexcept { return max_depth_; }

      private:
        int depth_;
        int max_depth_;
    };

    class loop_detected_error : public guardrail_error {
      public:
        explicit loop_detected_error(const std::string& chain_text);
    };

    // The target could not be started at all, as opposed to exiting non-zero
    class spawn_error : public std::runtime_error {
      public:
        using std::runtime_error::runtime_error;
    };

    // Raised for invalid command lines and unmet input requirements; maps to exit_code::invalid_usage
    class usage_error : public std::runtime_error {
      public:
        using std::runtime_error::runtime_error;
    };

}  // namespace sfa
