/**
 * @file audio_resegmenter.hpp
 * @brief Reproduces the cut/speed edits on the audio track
 *
 * @details Pre-pass of the export: every non-cut segment of the source
 *          audio is extracted with ffmpeg, time-stretched with a chain of
 *          atempo stages, and the pieces are concatenated losslessly. Any
 *          failure degrades to the original, unedited audio file.
 */

#ifndef CINECUT_AUDIO_RESEGMENTER_HPP
#define CINECUT_AUDIO_RESEGMENTER_HPP

#include <functional>
#include <string>
#include <vector>

#include "cancellation.hpp"
#include "types.hpp"

namespace cinecut {

/**
 * @struct AudioSegment
 * @brief Source range kept in the edit and its tempo factor.
 */
struct AudioSegment {
  double start;    //< Source start (seconds)
  double duration; //< Source duration (seconds)
  double speed;    //< Tempo factor; output lasts duration / speed
};

/// Ordered non-cut segments, same breakpoints as the video remapper.
std::vector<AudioSegment>
plan_audio_segments(double source_duration, const RegionMap<CutRegion> &cuts,
                    const RegionMap<SpeedRegion> &speeds);

/**
 * @brief atempo factors whose product is speed, each within [0.5, 2.0].
 * @return empty when |speed - 1| < 0.01
 */
std::vector<double> build_atempo_chain(double speed);

/// "atempo=2.0,atempo=1.5" (empty for an empty chain)
std::string atempo_filter(const std::vector<double> &chain);

/// ffmpeg arguments extracting and retiming one segment into output_path
std::vector<std::string> build_segment_args(const AudioSegment &segment,
                                            const std::string &audio_path,
                                            const std::string &output_path);

/// Concat demuxer list ("file '<path>'" per line, quotes escaped)
std::string build_concat_list(const std::vector<std::string> &files);

/// Runs ffmpeg with the given arguments and returns its exit code
using CommandRunner = std::function<int(const std::vector<std::string> &)>;

/**
 * @class AudioResegmenter
 * @brief Owns the temporary files of one resegmentation pass.
 *
 * @attention The processed file lives in a private temp directory removed
 *            by cleanup() or the destructor; keep the resegmenter alive
 *            until the muxer is done with it.
 */
class AudioResegmenter {
public:
  explicit AudioResegmenter(std::string audio_path);
  AudioResegmenter(std::string audio_path, CommandRunner runner);
  ~AudioResegmenter();

  AudioResegmenter(const AudioResegmenter &) = delete;
  AudioResegmenter &operator=(const AudioResegmenter &) = delete;

  /**
   * @brief Build the edited audio track.
   * @return path of the processed track, or the original audio path when
   *         no edit applies or any step fails
   * @throws ExportError(Cancelled) if cancelled between steps
   */
  std::string process(double source_duration, const RegionMap<CutRegion> &cuts,
                      const RegionMap<SpeedRegion> &speeds,
                      const CancellationToken *cancel = nullptr);

  /// Remove the temp directory (idempotent)
  void cleanup();

  const std::string &temp_dir() const { return temp_dir_; }

private:
  std::string audio_path_;
  CommandRunner runner_;
  std::string temp_dir_;
};

} // namespace cinecut

#endif // CINECUT_AUDIO_RESEGMENTER_HPP
