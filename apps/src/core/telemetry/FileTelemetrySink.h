#pragma once

#include "TelemetrySink.h"

#include <filesystem>
#include <fstream>
#include <memory>
#include <ostream>
#include <utility>
#include <vector>

namespace EcoSim {

/**
 * Appends every telemetry message to a file.
 *
 * Json: one object per line with an "event" key. "step" lines carry the snapshot
 * keys with the metadata keys merged in; "episode_start" and "episode_complete"
 * lines carry the start event and the episode summary.
 * Binary: frames of [uint32 little-endian payload size][payload], where the payload
 * is zpp_bits(RecordKind, record...).
 */
class FileTelemetrySink : public TelemetrySink {
public:
    enum class Format { Json, Binary };

    enum class RecordKind : uint8_t { Snapshot = 0, EpisodeStart = 1, EpisodeComplete = 2 };

    using Frame = std::pair<EpisodeMetadata, WorldSnapshot>;

    // Contents of a binary telemetry file, each kind in file order.
    struct Log {
        std::vector<EpisodeStartEvent> starts;
        std::vector<Frame> frames;
        std::vector<EpisodeSummary> completions;
    };

    // Throws std::runtime_error if the file cannot be opened for appending.
    FileTelemetrySink(const std::filesystem::path& path, Format format);

    // Writes to an already open stream; path is only used in messages.
    FileTelemetrySink(
        std::unique_ptr<std::ostream> stream, Format format, std::filesystem::path path);

    Result<std::monostate, std::string> episodeStarted(const EpisodeStartEvent& event) override;

    Result<std::monostate, std::string> publish(
        const WorldSnapshot& snapshot, const EpisodeMetadata& meta) override;

    Result<std::monostate, std::string> episodeCompleted(const EpisodeSummary& summary) override;

    Format format() const { return format_; }
    const std::filesystem::path& path() const { return path_; }

    static Result<Format, std::string> parseFormat(const std::string& name);

    // Reads back a binary telemetry file. Truncated, oversized or malformed frames
    // and unknown record kinds are errors.
    static Result<Log, std::string> readBinaryFile(const std::filesystem::path& path);

private:
    template <typename... Records>
    void writeFrame(RecordKind kind, const Records&... records);

    Result<std::monostate, std::string> finishWrite(const char* what);

    std::filesystem::path path_;
    Format format_;
    std::unique_ptr<std::ostream> stream_;
};

} // namespace EcoSim
