#pragma once

#include"Algorithms/Algorithm.hpp"
#include"Algorithms/CorrectionTrainer.hpp"
#include"Algorithms/GroupRelativeTrainer.hpp"
#include"Algorithms/TrajectoryTrainer.hpp"

#include"Model/modelUtils.hpp"
#include"Model/PolicyModel.hpp"
#include"Model/VisionLanguagePolicy.hpp"

#include"Config.hpp"
#include"Dialogue.hpp"
#include"MetricsLogger.hpp"
#include"SpanMasker.hpp"
#include"Tokenizer.hpp"
#include"Trajectory.hpp"
#include"TrajectoryWindower.hpp"
