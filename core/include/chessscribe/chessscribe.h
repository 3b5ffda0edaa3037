#pragma once

/// \file chessscribe.h
/// \brief Umbrella header: includes every public header in ChessScribe.

#include "export.h"
#include "error.h"
#include "common.h"
#include "logging.h"
#include "encoding.h"
#include "document.h"
#include "block_stream.h"
#include "notation.h"
#include "pattern.h"
#include "solution.h"
#include "chessboard.h"
#include "assembler.h"
#include "diagram.h"
#include "grid.h"
#include "ocr.h"
#include "bubble.h"
#include "recognition.h"
#include "config.h"
#include "record_io.h"
#include "pipeline.h"
