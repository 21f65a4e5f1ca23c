#pragma once
// Entrylog Library - Core Public Header

#include <entrylog/core/algo.h>
#include <entrylog/core/anchor_builder.h>
#include <entrylog/core/axis_mapper.h>
#include <entrylog/core/color_palette.h>
#include <entrylog/core/constants.h>
#include <entrylog/core/draft_interaction.h>
#include <entrylog/core/entry_rules.h>
#include <entrylog/core/entry_source.h>
#include <entrylog/core/gap_allocation.h>
#include <entrylog/core/time_format.h>
#include <entrylog/core/timeline_config.h>
#include <entrylog/core/timeline_layout.h>
#include <entrylog/core/timeline_session.h>
#include <entrylog/core/types.h>
