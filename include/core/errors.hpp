#ifndef CAPTUREAP_CORE_ERRORS_HPP
#define CAPTUREAP_CORE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace captureap
{
    namespace core
    {

        /**
         * Base of every failure that ends an invocation.
         * main() reports what() as a single ERROR line and exits 1.
         */
        class CaptureApError : public std::runtime_error
        {
        public:
            explicit CaptureApError(const std::string &message) : std::runtime_error(message) {}
        };

        /// Bad or missing command-line value, bad interface, malformed tool configuration
        class ValidationError : public CaptureApError
        {
        public:
            using CaptureApError::CaptureApError;
        };

        /// A required external executable is not installed
        class DependencyError : public CaptureApError
        {
        public:
            using CaptureApError::CaptureApError;
        };

        /// Not running with root privileges
        class PrivilegeError : public CaptureApError
        {
        public:
            using CaptureApError::CaptureApError;
        };

        /// Teardown requested but no prior bring-up is recorded
        class StateError : public CaptureApError
        {
        public:
            using CaptureApError::CaptureApError;
        };

        /**
         * An invoked tool or service returned failure
         */
        class ExternalCommandError : public CaptureApError
        {
        public:
            ExternalCommandError(const std::string &step, const std::string &message, int exit_status = -1)
                : CaptureApError(message), step_(step), exit_status_(exit_status)
            {
            }

            const std::string &step() const { return step_; }
            int exit_status() const { return exit_status_; }

        private:
            std::string step_;
            int exit_status_;
        };

    } // namespace core
} // namespace captureap

#endif // CAPTUREAP_CORE_ERRORS_HPP
