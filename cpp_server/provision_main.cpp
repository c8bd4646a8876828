#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <stdexcept>
#include <string>
#include <sys/file.h>
#include <unistd.h>

#include "config.hpp"
#include "logger.hpp"
#include "minio_admin.hpp"
#include "provisioner.hpp"

namespace {

// Exclusive advisory lock held for the life of the process.
class ProcessLock {
public:
    explicit ProcessLock(const std::string& path) : fd_(::open(path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0600)) {
        if (fd_ < 0) {
            throw std::runtime_error("Cannot open lock file " + path + ": " + std::strerror(errno));
        }
        if (::flock(fd_, LOCK_EX | LOCK_NB) != 0) {
            int err = errno;
            ::close(fd_);
            fd_ = -1;
            if (err == EWOULDBLOCK) {
                throw std::runtime_error("Another provisioning run holds " + path);
            }
            throw std::runtime_error("Cannot lock " + path + ": " + std::strerror(err));
        }
    }

    ~ProcessLock() {
        if (fd_ >= 0) {
            ::flock(fd_, LOCK_UN);
            ::close(fd_);
        }
    }

    ProcessLock(const ProcessLock&) = delete;
    ProcessLock& operator=(const ProcessLock&) = delete;

private:
    int fd_;
};

std::string ConfigPath(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) return argv[i + 1];
    }
    const char* env = std::getenv("BUCKETBRIDGE_CONFIG");
    if (env != nullptr && *env != '\0') return env;
    return "config.json";
}

} // namespace

int main(int argc, char** argv) {
    Logger::Info("Starting object store provisioning...", "Provision");

    try {
        Config::Instance().Load(ConfigPath(argc, argv), Config::Role::Provisioner);
    } catch (const std::exception& e) {
        Logger::Fatal(std::string("Invalid configuration: ") + e.what(), "Config");
        return EXIT_FAILURE;
    }
    const auto& config = Config::Instance().Get();
    Logger::SetLevel(Logger::ParseLevel(config.log_level));

    try {
        ProcessLock lock(config.admin_lock_file);
        MinioAdminClient admin(config);
        Provisioner provisioner(admin, PlanFromConfig(config));

        ProvisionState result = provisioner.Run();
        if (result != ProvisionState::Done) {
            Logger::Fatal("Provisioning failed: " + provisioner.FailureReason(), "Provision");
            return EXIT_FAILURE;
        }
    } catch (const std::exception& e) {
        Logger::Fatal(e.what(), "Provision");
        return EXIT_FAILURE;
    }

    Logger::Info("Object store provisioning completed successfully", "Provision");
    return EXIT_SUCCESS;
}
