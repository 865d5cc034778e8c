#include "utils/Log.hpp"

#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>

namespace wb::log
{

namespace
{

std::mutex &sink_mutex()
{
    static std::mutex s_mutex;
    return s_mutex;
}

std::ofstream &sink_stream()
{
    static std::ofstream s_ofs;
    return s_ofs;
}

std::optional<std::filesystem::path> &sink_path()
{
    static std::optional<std::filesystem::path> s_path;
    return s_path;
}

} // namespace

void set_log_file(std::filesystem::path path)
{
    std::lock_guard<std::mutex> lk(sink_mutex());
    auto &ofs = sink_stream();
    if (ofs.is_open())
    {
        ofs.close();
    }
    sink_path() = std::move(path);
}

void append_log_line_to_file(std::string const &line)
{
    std::lock_guard<std::mutex> lk(sink_mutex());
    auto &path = sink_path();
    if (!path)
    {
        path = std::filesystem::path("windowbridge.log");
    }
    auto &ofs = sink_stream();
    if (!ofs.is_open())
    {
        ofs.open(path->string(), std::ios::app | std::ios::out);
    }
    if (ofs.is_open())
    {
        ofs << line << '\n';
        ofs.flush();
    }
}

} // namespace wb::log
