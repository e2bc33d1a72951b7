/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Exported functions of the pattern extraction library
/// \file extract.hpp
#ifndef _PEXTRACT_LIB_EXTRACT_HPP_INCLUDED
#define _PEXTRACT_LIB_EXTRACT_HPP_INCLUDED

/// \brief strus toplevel namespace
namespace strus {
/// \brief Forward declaration
class ErrorBufferInterface;
}

/// \brief pextract toplevel namespace
namespace pextract {

/// \brief Forward declaration
class PatternRegistryInterface;
/// \brief Forward declaration
class PatternExtractorInterface;

/// \brief Create an empty table of named patterns
/// \return the registry (with ownership) or NULL on error
PatternRegistryInterface* createPatternRegistry(
		strus::ErrorBufferInterface* errorhnd);

/// \brief Define all standard categories (numbers, addresses, credentials, paths, strings, ...) in a registry
/// \return true on success, false on error (error reported in error buffer)
bool defineStandardPatterns(
		PatternRegistryInterface* registry,
		strus::ErrorBufferInterface* errorhnd);

/// \brief Create a registry with all standard categories defined
/// \note All registries created share one immutable process wide table of patterns that is built on the first call.
///	Each of them reports its errors to the error buffer passed here.
/// \return the registry (with ownership) or NULL on error
PatternRegistryInterface* createStandardPatternRegistry(
		strus::ErrorBufferInterface* errorhnd);

/// \brief Create the interface for extracting categories from text based on the Intel hyperscan library
/// \return the extractor (with ownership) or NULL on error
PatternExtractorInterface* createPatternExtractor_hyperscan(
		strus::ErrorBufferInterface* errorhnd);

}//namespace
#endif

