#pragma once

#include <cstdint>
#include <iosfwd>
#include <mutex>
#include <string>
#include <vector>

#include "uplink/client/agent.hpp"
#include "uplink/client/logger.hpp"

namespace uplink::client
{

    /// Line-oriented operator console over an UploadAgent. Status transitions are
    /// printed as they happen.
    class Shell
    {
    public:
        Shell(UploadAgent &agent, std::istream &input, std::ostream &output, Logger logger);
        ~Shell();

        Shell(const Shell &) = delete;
        Shell &operator=(const Shell &) = delete;

        /// Reads commands until EXIT or end of input.
        void run();

        /// Executes one command line. Returns false when the line asks to exit.
        bool execute(const std::string &line);

    private:
        bool dispatch(const std::string &command, const std::vector<std::string> &args);

        bool handle_enqueue(const std::vector<std::string> &args);
        bool handle_simple(const std::string &command, const std::vector<std::string> &args);
        bool handle_retry(const std::vector<std::string> &args);
        bool handle_priority(const std::vector<std::string> &args);
        bool handle_status(const std::vector<std::string> &args);
        bool handle_list(const std::vector<std::string> &args);
        bool handle_history(const std::vector<std::string> &args);
        bool handle_stats();
        bool handle_clear();
        bool handle_remote();

        void print_help();
        void print_task(const UploadTask &task);
        void print_error(const std::string &code, const std::string &message = {});

        UploadAgent &agent_;
        std::istream &input_;
        std::ostream &output_;
        Logger logger_;
        std::mutex output_mutex_;
        std::uint64_t subscription_{0};
    };

} // namespace uplink::client
