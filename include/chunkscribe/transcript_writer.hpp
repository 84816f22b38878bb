#ifndef CHUNKSCRIBE_TRANSCRIPT_WRITER_HPP
#define CHUNKSCRIBE_TRANSCRIPT_WRITER_HPP

#include <chrono>
#include <fstream>
#include <string>

namespace chunkscribe {

// Appends transcript fragments to <dir>/<YYYY-MM-DD_HH-MM-SS>.txt.
// The file is created on the first non-empty fragment.
class TranscriptWriter {
public:
    explicit TranscriptWriter(std::string directory);

    // Returns false if the file cannot be created or written
    bool append(const std::string& fragment);

    // Empty until the first successful append
    const std::string& path() const { return path_; }

    static std::string fileNameFor(std::chrono::system_clock::time_point time);

private:
    bool openFile();

    std::string directory_;
    std::string path_;
    std::ofstream file_;
};

} // namespace chunkscribe

#endif // CHUNKSCRIBE_TRANSCRIPT_WRITER_HPP
