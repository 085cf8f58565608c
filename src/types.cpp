/**
 * @file types.cpp
 * @brief Name tables for error kinds and join strategies
 */

#include "loopify/types.hpp"

namespace loopify {

const char *to_string(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::Ok:
    return "Ok";
  case ErrorKind::InputNotFound:
    return "InputNotFound";
  case ErrorKind::ProbeFailure:
    return "ProbeFailure";
  case ErrorKind::NoAudioStream:
    return "NoAudioStream";
  case ErrorKind::InvalidDuration:
    return "InvalidDuration";
  case ErrorKind::InvalidCutSpec:
    return "InvalidCutSpec";
  case ErrorKind::OutputDirMissing:
    return "OutputDirMissing";
  case ErrorKind::OverwriteRefused:
    return "OverwriteRefused";
  case ErrorKind::SplitFailure:
    return "SplitFailure";
  case ErrorKind::JoinFailure:
    return "JoinFailure";
  case ErrorKind::CommitFailure:
    return "CommitFailure";
  }
  return "Unknown";
}

const char *to_string(JoinStrategy strategy) {
  switch (strategy) {
  case JoinStrategy::LosslessCopy:
    return "lossless-copy";
  case JoinStrategy::FilterReencode:
    return "filter-reencode";
  }
  return "unknown";
}

} // namespace loopify
