#include "FileTelemetrySink.h"

#include "core/LoggingChannels.h"

#include <array>
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace EcoSim {

namespace {

std::array<char, 4> encodeFrameSize(uint32_t size)
{
    return { static_cast<char>(size & 0xFF),
             static_cast<char>((size >> 8) & 0xFF),
             static_cast<char>((size >> 16) & 0xFF),
             static_cast<char>((size >> 24) & 0xFF) };
}

uint32_t decodeFrameSize(const std::array<unsigned char, 4>& bytes)
{
    return static_cast<uint32_t>(bytes[0]) | (static_cast<uint32_t>(bytes[1]) << 8)
        | (static_cast<uint32_t>(bytes[2]) << 16) | (static_cast<uint32_t>(bytes[3]) << 24);
}

} // namespace

FileTelemetrySink::FileTelemetrySink(const std::filesystem::path& path, Format format)
    : path_(path), format_(format)
{
    auto mode = std::ios::out | std::ios::app;
    if (format_ == Format::Binary) {
        mode |= std::ios::binary;
    }
    auto file = std::make_unique<std::ofstream>(path_, mode);
    if (!file->is_open()) {
        throw std::runtime_error("Cannot open telemetry file: " + path_.string());
    }
    stream_ = std::move(file);
    LOG_INFO(
        Telemetry,
        "Writing {} telemetry to {}",
        format_ == Format::Json ? "json" : "binary",
        path_.string());
}

FileTelemetrySink::FileTelemetrySink(
    std::unique_ptr<std::ostream> stream, Format format, std::filesystem::path path)
    : path_(std::move(path)), format_(format), stream_(std::move(stream))
{
    if (!stream_) {
        throw std::invalid_argument("FileTelemetrySink needs a stream");
    }
}

template <typename... Records>
void FileTelemetrySink::writeFrame(RecordKind kind, const Records&... records)
{
    std::vector<std::byte> payload;
    zpp::bits::out out(payload);
    out(kind, records...).or_throw();

    const auto header = encodeFrameSize(static_cast<uint32_t>(payload.size()));
    stream_->write(header.data(), header.size());
    stream_->write(
        reinterpret_cast<const char*>(payload.data()),
        static_cast<std::streamsize>(payload.size()));
}

Result<std::monostate, std::string> FileTelemetrySink::finishWrite(const char* what)
{
    stream_->flush();
    if (!stream_->good()) {
        // Later messages get a fresh attempt.
        stream_->clear();
        return Result<std::monostate, std::string>::error(
            std::string(what) + " write failed: " + path_.string());
    }
    return Result<std::monostate, std::string>::okay(std::monostate{});
}

Result<std::monostate, std::string> FileTelemetrySink::episodeStarted(
    const EpisodeStartEvent& event)
{
    if (format_ == Format::Json) {
        *stream_ << nlohmann::json(event).dump() << '\n';
    }
    else {
        writeFrame(RecordKind::EpisodeStart, event);
    }
    return finishWrite("Episode start");
}

Result<std::monostate, std::string> FileTelemetrySink::publish(
    const WorldSnapshot& snapshot, const EpisodeMetadata& meta)
{
    if (format_ == Format::Json) {
        nlohmann::json j = snapshot;
        j.update(nlohmann::json(meta));
        j["event"] = "step";
        *stream_ << j.dump() << '\n';
    }
    else {
        writeFrame(RecordKind::Snapshot, meta, snapshot);
    }

    auto result = finishWrite("Snapshot");
    if (result.isValue()) {
        LOG_TRACE(Telemetry, "Published episode {} step {}", meta.episode, meta.step);
    }
    return result;
}

Result<std::monostate, std::string> FileTelemetrySink::episodeCompleted(
    const EpisodeSummary& summary)
{
    if (format_ == Format::Json) {
        nlohmann::json j = summary;
        j["event"] = "episode_complete";
        *stream_ << j.dump() << '\n';
    }
    else {
        writeFrame(RecordKind::EpisodeComplete, summary);
    }
    return finishWrite("Episode summary");
}

Result<FileTelemetrySink::Format, std::string> FileTelemetrySink::parseFormat(
    const std::string& name)
{
    if (name == "json") {
        return Result<Format, std::string>::okay(Format::Json);
    }
    if (name == "binary") {
        return Result<Format, std::string>::okay(Format::Binary);
    }
    return Result<Format, std::string>::error(
        "Unknown telemetry format '" + name + "' (expected json or binary)");
}

Result<FileTelemetrySink::Log, std::string> FileTelemetrySink::readBinaryFile(
    const std::filesystem::path& path)
{
    using LogResult = Result<Log, std::string>;

    std::error_code ec;
    const auto fileSize = std::filesystem::file_size(path, ec);
    std::ifstream in(path, std::ios::binary);
    if (ec || !in.is_open()) {
        return LogResult::error("Cannot open telemetry file: " + path.string());
    }

    Log log;
    size_t index = 0;
    uint64_t offset = 0;
    std::array<unsigned char, 4> header{};
    for (; in.read(reinterpret_cast<char*>(header.data()), header.size()); ++index) {
        offset += header.size();
        const uint32_t size = decodeFrameSize(header);
        if (size > fileSize - offset) {
            return LogResult::error(
                "Truncated frame " + std::to_string(index) + " in " + path.string());
        }

        std::vector<std::byte> payload(size);
        if (!in.read(reinterpret_cast<char*>(payload.data()), size)) {
            return LogResult::error(
                "Truncated frame " + std::to_string(index) + " in " + path.string());
        }
        offset += size;

        zpp::bits::in decoder(payload);
        RecordKind kind{};
        bool decoded = !zpp::bits::failure(decoder(kind));
        if (decoded) {
            switch (kind) {
                case RecordKind::Snapshot: {
                    Frame frame;
                    decoded = !zpp::bits::failure(decoder(frame.first, frame.second));
                    log.frames.push_back(std::move(frame));
                    break;
                }
                case RecordKind::EpisodeStart: {
                    EpisodeStartEvent event;
                    decoded = !zpp::bits::failure(decoder(event));
                    log.starts.push_back(event);
                    break;
                }
                case RecordKind::EpisodeComplete: {
                    EpisodeSummary summary;
                    decoded = !zpp::bits::failure(decoder(summary));
                    log.completions.push_back(std::move(summary));
                    break;
                }
                default:
                    decoded = false;
                    break;
            }
        }
        if (!decoded) {
            return LogResult::error(
                "Malformed frame " + std::to_string(index) + " in " + path.string());
        }
    }

    return LogResult::okay(std::move(log));
}

} // namespace EcoSim
