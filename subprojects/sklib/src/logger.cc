#include <sklib/debug.hh>
#include <sklib/logger.hh>
#include <sklib/time.hh>

namespace {

FILE* open_for_append(const std::string& filename) {
    FILE* f = fopen(filename.c_str(), "ae");
    if (f == nullptr) {
        THROW("fopen('", filename, "') failed", errmsg());
    }
    return f;
}

} // namespace

Logger::Logger(const std::string& filename)
: f_(open_for_append(filename))
, opened_(true) {}

void Logger::open(const std::string& filename) {
    FILE* f = open_for_append(filename);
    close();
    f_ = f;
    opened_ = true;
}

void Logger::Appender::flush() noexcept {
    if (flushed_) {
        return;
    }
    flushed_ = true;

    // The date is formatted before taking the lock, "?" if that fails
    char date[32] = "?";
    if (label_) {
        try {
            auto str = mysql_localdate();
            (void)snprintf(date, sizeof(date), "%s", str.c_str());
        } catch (const std::exception&) { // NOLINT(bugprone-empty-catch)
        }
    }

    if (logger_.lock()) {
        auto len = static_cast<int>(buff_.size());
        if (label_) {
            (void)fprintf(logger_.f_, "[ %s ] %.*s\n", date, len, buff_.data());
        } else {
            (void)fprintf(logger_.f_, "%.*s\n", len, buff_.data());
        }
        (void)fflush(logger_.f_);
        logger_.unlock();
    }
    buff_.clear();
}
