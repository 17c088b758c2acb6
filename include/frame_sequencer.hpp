#pragma once

#include "flow_field.hpp"
#include "kinematics.hpp"
#include "metrics.hpp"
#include "severity_profile.hpp"
#include "streamlines.hpp"
#include "valve_geometry.hpp"

#include <cstddef>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

// Everything a sequencer run needs besides the catalog and the grid
struct SequencerSettings {
  int resolution = 64;
  std::vector<std::string> severities{"healthy", "severe"};
  int total_frames = 240;
  int cycles = 1;
  CycleTiming timing;
  FlowModelParams flow;
  TraceSettings trace;
  MetricsParams metrics;
  std::vector<Vec2> seeds;
};

// One severity at one sampled time
struct SeverityFrame {
  std::string severity;
  CycleState state;
  std::vector<Vec2> deformed_vertices; // prescribed, not force-derived
  FlowField flow;
  std::vector<Streamline> streamlines;
  MetricSample metrics;
};

struct FrameRecord {
  int index;
  double t; // [s]
  std::vector<SeverityFrame> severities; // in settings.severities order
};

//---------------------------------------------
// Frame i is a pure function of t_i = i / total_frames * cycle * cycles.
// Base geometries are generated once in the constructor and never change,
// so frame() may be called in any order, repeatedly, or from several
// threads at once.
//---------------------------------------------
class FrameSequencer {
public:
  // Validates everything up front (ConfigurationError), before any frame.
  // A null deformation model selects RadialRetractionModel.
  FrameSequencer(const SeverityCatalog &catalog,
                 std::shared_ptr<const FlowGrid> grid,
                 SequencerSettings settings,
                 std::unique_ptr<DeformationModel> deformation = nullptr);

  int size() const { return settings_.total_frames; }
  double time_at(int index) const;

  // Throws std::out_of_range outside [0, size())
  FrameRecord frame(int index) const;

  const SequencerSettings &settings() const { return settings_; }
  const FlowGrid &grid() const { return *grid_; }
  const std::vector<ValveGeometry> &geometries() const { return geometries_; }
  const ValveGeometry &geometry(const std::string &severity) const;
  // Convex-hull area of each base geometry [cm^2]
  double base_area(const std::string &severity) const;
  const DeformationModel &deformation() const { return *deformation_; }

  // Lazy, restartable: every begin() starts again from frame 0
  class iterator {
  public:
    using iterator_category = std::input_iterator_tag;
    using value_type = FrameRecord;
    using difference_type = std::ptrdiff_t;
    using pointer = void;
    using reference = FrameRecord;

    iterator(const FrameSequencer *seq, int index) : seq_(seq), index_(index) {}

    FrameRecord operator*() const { return seq_->frame(index_); }
    iterator &operator++() {
      ++index_;
      return *this;
    }
    iterator operator++(int) {
      iterator tmp = *this;
      ++index_;
      return tmp;
    }
    bool operator==(const iterator &other) const {
      return seq_ == other.seq_ && index_ == other.index_;
    }
    bool operator!=(const iterator &other) const { return !(*this == other); }

  private:
    const FrameSequencer *seq_;
    int index_;
  };

  iterator begin() const { return iterator(this, 0); }
  iterator end() const { return iterator(this, size()); }

  // Calls fn(const FrameRecord &) for every frame in time order
  template <typename Fn> void run(Fn &&fn) const {
    for (int i = 0; i < size(); ++i)
      fn(frame(i));
  }

private:
  std::size_t slot(const std::string &severity) const;

  SequencerSettings settings_;
  std::shared_ptr<const FlowGrid> grid_;
  std::vector<SeverityProfile> profiles_;
  std::vector<ValveGeometry> geometries_;
  std::vector<double> base_areas_;
  std::unique_ptr<DeformationModel> deformation_;
};
