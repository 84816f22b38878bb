#include "chunkscribe/transcript_writer.hpp"
#include "chunkscribe/log.hpp"

#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <utility>

namespace chunkscribe {

TranscriptWriter::TranscriptWriter(std::string directory) : directory_(std::move(directory)) {
}

std::string TranscriptWriter::fileNameFor(std::chrono::system_clock::time_point time) {
    std::time_t t = std::chrono::system_clock::to_time_t(time);
    std::tm local_tm{};
    localtime_r(&t, &local_tm);

    std::ostringstream name;
    name << std::put_time(&local_tm, "%Y-%m-%d_%H-%M-%S") << ".txt";
    return name.str();
}

bool TranscriptWriter::openFile() {
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        logError("Transcript", "Cannot create " + directory_ + ": " + ec.message());
        return false;
    }

    const std::string path = (std::filesystem::path(directory_) / fileNameFor(std::chrono::system_clock::now())).string();
    file_.open(path, std::ios::app);
    if (!file_.is_open()) {
        logError("Transcript", "Cannot open " + path);
        return false;
    }
    path_ = path;
    logInfo("Transcript", "Saving transcript to " + path_);
    return true;
}

bool TranscriptWriter::append(const std::string& fragment) {
    if (fragment.empty()) {
        return true;
    }
    if (!file_.is_open() && !openFile()) {
        return false;
    }

    file_ << fragment;
    file_.flush();
    if (!file_) {
        logError("Transcript", "Write to " + path_ + " failed");
        return false;
    }
    return true;
}

} // namespace chunkscribe
