#pragma once

static constexpr bool kEnableDebug = true;

static constexpr bool kSaveDecodingOverlay = true && kEnableDebug;
static constexpr bool kSaveGraphPly = true && kEnableDebug;
static constexpr bool kSaveGraphJson = false && kEnableDebug;
