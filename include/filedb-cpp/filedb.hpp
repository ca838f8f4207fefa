/// @file filedb.hpp
/// @brief Umbrella header for the filedb-cpp library.
///
/// Include this single header for access to all public types:
/// Document, Ref, Transaction, Value, Path and Error, and the
/// combine() and execute() functions.

#pragma once

#include <filedb-cpp/document.hpp>
#include <filedb-cpp/error.hpp>
#include <filedb-cpp/executor.hpp>
#include <filedb-cpp/logging.hpp>
#include <filedb-cpp/path.hpp>
#include <filedb-cpp/ref.hpp>
#include <filedb-cpp/transaction.hpp>
#include <filedb-cpp/value.hpp>
