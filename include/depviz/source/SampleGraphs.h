#pragma once

#include "../core/DependencyGraph.h"
#include "IGraphSource.h"

#include <memory>

namespace depviz {

/// Built-in fixed graphs the analyzer runs against
class SampleGraphs {
public:
    /// Acyclic sample with shared sub-dependencies:
    /// A:[B,C] B:[D,E] C:[F,G] D:[H] E:[H,I] F:[] G:[I] H:[] I:[]
    static DependencyGraph normal();

    /// Three-package ring X -> Y -> Z -> X
    static DependencyGraph cyclic();

    /// Source for the requested repository mode. Real and test mode share
    /// the same static data.
    static std::unique_ptr<IGraphSource> forMode(bool testMode);

    /// Source used by the cycle-detection demonstration
    static std::unique_ptr<IGraphSource> cyclicSource();
};

}  // namespace depviz
