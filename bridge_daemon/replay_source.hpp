#ifndef REPLAY_SOURCE_HPP
#define REPLAY_SOURCE_HPP

#include <cstddef>
#include <string>
#include <vector>

#include "signal_source.hpp"

/**
 * ReplaySignalSource - plays back recorded simulator snapshots
 *
 * File format: a JSON array of objects keyed by SignalSnapshot field name.
 * Missing keys read as zero/false. A "fuel_tanks" array, when present, is
 * summed into fuel_total. Each read() returns the next frame; the last
 * frame repeats once the recording is exhausted.
 */
class ReplaySignalSource : public SignalSource {
public:
    ReplaySignalSource() = default;

    bool loadFromFile(const std::string &path);
    bool parseJson(const std::string &json_content);

    SignalSnapshot read() override;

    void rewind() { m_index = 0; }
    size_t frameCount() const { return m_frames.size(); }
    size_t position() const { return m_index; }
    bool isFinished() const { return m_index >= m_frames.size(); }

private:
    std::vector<SignalSnapshot> m_frames;
    size_t m_index = 0;
};

#endif // REPLAY_SOURCE_HPP
