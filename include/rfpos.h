#pragma once
// All-in-one rfpos include (cfg/store/fp/model/positioning/pipeline).

#include "rfpos_types.h"
#include "rfpos_version.h"

#include "common/errors.h"
#include "common/log.h"
#include "common/path_utils.h"
#include "common/time_utils.h"

#include "config/config_loader.h"
#include "config/config_types.h"

#include "store/reading_store.h"
#include "store/records.h"

#include "fingerprint/fingerprint_assembler.h"
#include "fingerprint/fingerprint_row.h"
#include "fingerprint/window_feature_extractor.h"
#include "fingerprint/window_stats.h"

#include "model/regressor.h"

#include "positioning/coordinate_model_trainer.h"
#include "positioning/gap_policy.h"
#include "positioning/position_evaluator.h"

#include "pipeline/positioning_pipeline.h"
