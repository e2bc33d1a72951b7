/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Definitions of the standard categories
/// \file "standardPatterns.hpp"
#ifndef _PEXTRACT_STANDARD_PATTERNS_HPP_INCLUDED
#define _PEXTRACT_STANDARD_PATTERNS_HPP_INCLUDED

namespace strus {
///\brief Forward declaration
class ErrorBufferInterface;
}

namespace pextract {

///\brief Forward declaration
class PatternRegistryInterface;
///\brief Forward declaration
class PatternRegistry;

/// \brief Define the standard categories in a registry
/// \note Throws an exception on error
void defineStandardPatternTable( PatternRegistryInterface& registry, strus::ErrorBufferInterface* errorhnd);

/// \brief Create a registry sharing the process wide table of the standard categories, that is defined on the first call
/// \param[in] errorhnd error buffer the registry created reports its errors to
/// \return the registry (with ownership)
/// \note Throws an exception on error
PatternRegistry* createStandardPatternRegistryHandle( strus::ErrorBufferInterface* errorhnd);

}//namespace
#endif

