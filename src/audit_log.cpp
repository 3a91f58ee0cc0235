#include "audit_log.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <system_error>
#include <sys/stat.h>
#include "logger.hpp"
#include "system_utils.hpp"

namespace syncguard {

void append_record(const std::filesystem::path& log_path, const std::string& line) {
    std::error_code ec;
    auto parent = log_path.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec)
            throw std::system_error(ec, "cannot create " + parent.string());
    }
    UniqueFd fd(open(log_path.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0644));
    if (!fd)
        throw std::system_error(errno, std::generic_category(), "cannot open " + log_path.string());
    struct stat st{};
    if (fstat(fd.get(), &st) != 0)
        throw std::system_error(errno, std::generic_category(), "cannot stat " + log_path.string());
    // A failed append is cut back to the previous end so no partial line remains.
    auto rollback = [&](const char* what) {
        int err = errno;
        if (ftruncate(fd.get(), st.st_size) != 0)
            log_error("Failed to roll back partial audit record",
                      {{"log", log_path.string()}, {"error", std::strerror(errno)}});
        throw std::system_error(err, std::generic_category(), what + log_path.string());
    };
    if (!write_all(fd.get(), line.data(), line.size()))
        rollback("cannot write ");
    if (fsync(fd.get()) != 0 && errno != EINVAL)
        rollback("cannot flush ");
}

std::vector<LogRecord> read_records(const std::filesystem::path& log_path) {
    std::ifstream in(log_path);
    if (!in.is_open())
        throw std::system_error(std::make_error_code(std::errc::no_such_file_or_directory),
                                "cannot open " + log_path.string());
    std::vector<LogRecord> out;
    std::string line;
    while (std::getline(in, line)) {
        if (line.empty())
            continue;
        out.push_back(parse_record(line));
    }
    return out;
}

} // namespace syncguard
