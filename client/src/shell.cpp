#include "uplink/client/shell.hpp"

#include <cctype>
#include <iomanip>
#include <iostream>
#include <sstream>

#include "uplink/client/chunker.hpp"

namespace uplink::client
{

    namespace
    {

        std::string trim(const std::string &input)
        {
            const auto begin = input.find_first_not_of(" \t\r\n");
            if (begin == std::string::npos)
            {
                return "";
            }
            const auto end = input.find_last_not_of(" \t\r\n");
            return input.substr(begin, end - begin + 1);
        }

        std::vector<std::string> split_tokens(const std::string &input)
        {
            std::vector<std::string> tokens;
            std::istringstream iss(input);
            std::string token;
            while (iss >> std::quoted(token))
            {
                tokens.push_back(token);
            }
            return tokens;
        }

        std::string to_upper(std::string value)
        {
            for (auto &ch : value)
            {
                ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
            }
            return value;
        }

        std::string format_percent(std::uint64_t done, std::uint64_t total)
        {
            if (total == 0)
            {
                return "100%";
            }
            std::ostringstream oss;
            oss << std::fixed << std::setprecision(1) << (100.0 * static_cast<double>(done) / static_cast<double>(total))
                << '%';
            return oss.str();
        }

        int parse_priority(const std::string &value)
        {
            std::size_t consumed = 0;
            const int priority = std::stoi(value, &consumed);
            if (consumed != value.size())
            {
                throw std::invalid_argument("priority must be a number");
            }
            return priority;
        }

    } // namespace

    Shell::Shell(UploadAgent &agent, std::istream &input, std::ostream &output, Logger logger)
        : agent_(agent), input_(input), output_(output), logger_(std::move(logger))
    {
        subscription_ = agent_.subscribe([this](const TaskEvent &event)
                                         {
            if (event.is_progress()) {
                return;
            }
            std::lock_guard lock(output_mutex_);
            output_ << "[event] " << event.task_id << ' ' << to_string(event.old_status) << " -> "
                    << to_string(event.new_status) << " (" << event.bytes_acked << '/' << event.total_bytes << ')';
            if (event.error) {
                output_ << " error: " << *event.error;
            }
            output_ << std::endl; });
    }

    Shell::~Shell()
    {
        agent_.unsubscribe(subscription_);
        // The dispatcher may be inside the observer right now.
        agent_.events().flush();
    }

    void Shell::run()
    {
        while (true)
        {
            {
                std::lock_guard lock(output_mutex_);
                output_ << "uplink> " << std::flush;
            }
            std::string line;
            if (!std::getline(input_, line))
            {
                std::lock_guard lock(output_mutex_);
                output_ << std::endl;
                break;
            }
            if (!execute(line))
            {
                break;
            }
        }
    }

    bool Shell::execute(const std::string &raw_line)
    {
        const auto line = trim(raw_line);
        if (line.empty())
        {
            return true;
        }
        logger_.log("cmd", line);

        const auto tokens = split_tokens(line);
        if (tokens.empty())
        {
            return true;
        }
        const auto command = to_upper(tokens[0]);
        const std::vector<std::string> args(tokens.begin() + 1, tokens.end());

        if (command == "EXIT" || command == "QUIT")
        {
            std::lock_guard lock(output_mutex_);
            output_ << "OK" << std::endl;
            return false;
        }
        if (command == "HELP")
        {
            print_help();
            return true;
        }

        try
        {
            if (!dispatch(command, args))
            {
                print_error("unsupported_command");
            }
        }
        catch (const chunking::SourceReadError &ex)
        {
            print_error(std::string(uplink::to_string(ex.code())), ex.what());
        }
        catch (const StateStoreError &ex)
        {
            print_error(std::string(uplink::to_string(ex.code())), ex.what());
            logger_.error("cmd", "command failed: ", ex.what());
        }
        catch (const TransferError &ex)
        {
            print_error(std::string(uplink::to_string(ex.code())), ex.what());
        }
        catch (const std::invalid_argument &ex)
        {
            print_error("invalid_argument", ex.what());
        }
        catch (const std::exception &ex)
        {
            print_error("internal_error", ex.what());
            logger_.error("cmd", "command failed: ", ex.what());
        }
        return true;
    }

    bool Shell::dispatch(const std::string &command, const std::vector<std::string> &args)
    {
        if (command == "ENQUEUE")
        {
            return handle_enqueue(args);
        }
        if (command == "CANCEL" || command == "PAUSE" || command == "RESUME")
        {
            return handle_simple(command, args);
        }
        if (command == "RETRY")
        {
            return handle_retry(args);
        }
        if (command == "PRIORITY")
        {
            return handle_priority(args);
        }
        if (command == "STATUS")
        {
            return handle_status(args);
        }
        if (command == "LIST")
        {
            return handle_list(args);
        }
        if (command == "HISTORY")
        {
            return handle_history(args);
        }
        if (command == "STATS")
        {
            return handle_stats();
        }
        if (command == "CLEAR")
        {
            return handle_clear();
        }
        if (command == "REMOTE")
        {
            return handle_remote();
        }
        return false;
    }

    bool Shell::handle_enqueue(const std::vector<std::string> &args)
    {
        if (args.size() < 2 || args.size() > 3)
        {
            print_error("invalid_argument", "usage: ENQUEUE <file> <destination> [priority]");
            return true;
        }
        const int priority = args.size() == 3 ? parse_priority(args[2]) : 5;
        const auto id = agent_.enqueue(args[0], args[1], priority);
        std::lock_guard lock(output_mutex_);
        output_ << "OK " << id << std::endl;
        return true;
    }

    bool Shell::handle_simple(const std::string &command, const std::vector<std::string> &args)
    {
        if (args.size() != 1)
        {
            print_error("invalid_argument", "usage: " + command + " <id>");
            return true;
        }
        bool applied = false;
        if (command == "CANCEL")
        {
            applied = agent_.cancel(args[0]);
        }
        else if (command == "PAUSE")
        {
            applied = agent_.pause(args[0]);
        }
        else
        {
            applied = agent_.resume(args[0]);
        }
        if (!applied)
        {
            print_error("not_applicable", "task " + args[0] + " is unknown or in the wrong state");
            return true;
        }
        std::lock_guard lock(output_mutex_);
        output_ << "OK" << std::endl;
        return true;
    }

    bool Shell::handle_retry(const std::vector<std::string> &args)
    {
        if (args.size() != 1)
        {
            print_error("invalid_argument", "usage: RETRY <id>|ALL");
            return true;
        }
        if (to_upper(args[0]) == "ALL")
        {
            const auto count = agent_.retry_all_failed();
            std::lock_guard lock(output_mutex_);
            output_ << "OK " << count << " task(s) re-queued" << std::endl;
            return true;
        }
        if (!agent_.retry(args[0]))
        {
            print_error("not_applicable", "task " + args[0] + " is unknown or not FAILED");
            return true;
        }
        std::lock_guard lock(output_mutex_);
        output_ << "OK" << std::endl;
        return true;
    }

    bool Shell::handle_priority(const std::vector<std::string> &args)
    {
        if (args.size() != 2)
        {
            print_error("invalid_argument", "usage: PRIORITY <id> <1-10>");
            return true;
        }
        if (!agent_.reprioritize(args[0], parse_priority(args[1])))
        {
            print_error("not_applicable", "task " + args[0] + " is unknown or finished");
            return true;
        }
        std::lock_guard lock(output_mutex_);
        output_ << "OK" << std::endl;
        return true;
    }

    bool Shell::handle_status(const std::vector<std::string> &args)
    {
        if (args.size() != 1)
        {
            print_error("invalid_argument", "usage: STATUS <id>");
            return true;
        }
        const auto task = agent_.get_status(args[0]);
        if (!task)
        {
            print_error(std::string(uplink::to_string(uplink::ErrorCode::NotFound)), "unknown task " + args[0]);
            return true;
        }
        std::lock_guard lock(output_mutex_);
        output_ << "OK" << std::endl;
        output_ << "  id:          " << task->id << '\n'
                << "  source:      " << task->source_path.string() << '\n'
                << "  destination: " << task->destination << '\n'
                << "  status:      " << to_string(task->status) << '\n'
                << "  priority:    " << task->priority << '\n'
                << "  progress:    " << task->bytes_acked << '/' << task->total_bytes << " bytes ("
                << format_percent(task->bytes_acked, task->total_bytes) << "), " << task->contiguous_acked() << '/'
                << task->chunks.size() << " chunks\n"
                << "  retries:     " << task->retry_count << '\n';
        if (!task->last_error.empty())
        {
            output_ << "  last error:  " << task->last_error << '\n';
        }
        output_ << std::flush;
        return true;
    }

    bool Shell::handle_list(const std::vector<std::string> &args)
    {
        TaskFilter filter;
        if (!args.empty())
        {
            filter.status = task_status_from_string(to_upper(args[0]));
            if (!filter.status)
            {
                print_error("invalid_argument", "unknown status " + args[0]);
                return true;
            }
        }
        const auto tasks = agent_.list_tasks(filter);
        std::lock_guard lock(output_mutex_);
        output_ << "OK " << tasks.size() << " task(s)" << std::endl;
        for (const auto &task : tasks)
        {
            print_task(task);
        }
        return true;
    }

    bool Shell::handle_history(const std::vector<std::string> &args)
    {
        const std::size_t limit = args.empty() ? 20 : static_cast<std::size_t>(std::stoul(args[0]));
        const auto entries = agent_.history(limit);
        std::lock_guard lock(output_mutex_);
        output_ << "OK" << std::endl;
        for (const auto &entry : entries)
        {
            output_ << "  " << entry.task.id << ' ' << std::left << std::setw(10) << to_string(entry.task.status)
                    << std::right << entry.task.destination << "  " << entry.task.total_bytes << " bytes in "
                    << entry.duration.count() << " ms";
            if (!entry.task.last_error.empty())
            {
                output_ << "  (" << entry.task.last_error << ')';
            }
            output_ << '\n';
        }
        output_ << std::flush;
        return true;
    }

    bool Shell::handle_stats()
    {
        const auto stats = agent_.stats();
        std::lock_guard lock(output_mutex_);
        output_ << "OK" << std::endl;
        output_ << "  pending:   " << stats.pending << '\n'
                << "  uploading: " << stats.uploading << '\n'
                << "  paused:    " << stats.paused << '\n'
                << "  completed: " << stats.completed << '\n'
                << "  failed:    " << stats.failed << '\n'
                << "  cancelled: " << stats.cancelled << '\n'
                << "  uploaded:  " << stats.bytes_uploaded << " bytes\n"
                << "  collector: " << (stats.online ? "reachable" : "unreachable") << std::endl;
        return true;
    }

    bool Shell::handle_clear()
    {
        const auto removed = agent_.clear_finished();
        std::lock_guard lock(output_mutex_);
        output_ << "OK " << removed << " task(s) removed" << std::endl;
        return true;
    }

    bool Shell::handle_remote()
    {
        const auto uploads = agent_.remote_uploads();
        std::lock_guard lock(output_mutex_);
        output_ << "OK " << uploads.size() << " file(s)" << std::endl;
        for (const auto &upload : uploads)
        {
            output_ << "  " << upload.destination << "  " << upload.size << " bytes  " << upload.checksum.substr(0, 16)
                    << "  " << upload.completed_at << '\n';
        }
        output_ << std::flush;
        return true;
    }

    void Shell::print_help()
    {
        std::lock_guard lock(output_mutex_);
        output_ << "Available commands:\n"
                << "  HELP                                 Show this help\n"
                << "  EXIT                                 Stop the agent and exit\n"
                << "  ENQUEUE <file> <dest> [priority]     Queue a file for upload (priority 1-10, default 5)\n"
                << "  CANCEL <id>                          Cancel a task\n"
                << "  PAUSE <id>                           Pause a task, keeping its progress\n"
                << "  RESUME <id>                          Resume a paused task\n"
                << "  RETRY <id>|ALL                       Re-queue failed task(s)\n"
                << "  PRIORITY <id> <priority>             Change a task's priority\n"
                << "  STATUS <id>                          Show one task\n"
                << "  LIST [status]                        List tasks, optionally by status\n"
                << "  HISTORY [n]                          Show the last n finished tasks\n"
                << "  STATS                                Show queue statistics\n"
                << "  CLEAR                                Remove finished tasks\n"
                << "  REMOTE                               List files published on the collector\n"
                << std::flush;
    }

    void Shell::print_task(const UploadTask &task)
    {
        output_ << "  " << task.id << ' ' << std::left << std::setw(10) << to_string(task.status) << std::right
                << " p" << std::setw(2) << task.priority << ' ' << std::setw(7)
                << format_percent(task.bytes_acked, task.total_bytes) << "  " << task.destination << '\n'
                << std::flush;
    }

    void Shell::print_error(const std::string &code, const std::string &message)
    {
        std::lock_guard lock(output_mutex_);
        output_ << "ERROR: " << code << std::endl;
        if (!message.empty())
        {
            output_ << message << std::endl;
        }
    }

} // namespace uplink::client
