#pragma once

/**
 * @file export.h
 * @brief Symbol visibility macros for the SpeechText library
 *
 * NOTE: Symbols use default visibility; SPEECHTEXT_API is kept as an
 *       empty macro so headers stay annotated.
 */

#define SPEECHTEXT_API

