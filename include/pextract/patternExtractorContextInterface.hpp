/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Interface for pulling the occurrencies of the selected categories from one input stream
/// \file "patternExtractorContextInterface.hpp"
#ifndef _PEXTRACT_PATTERN_EXTRACTOR_CONTEXT_INTERFACE_HPP_INCLUDED
#define _PEXTRACT_PATTERN_EXTRACTOR_CONTEXT_INTERFACE_HPP_INCLUDED
#include "pextract/match.hpp"

namespace pextract
{

/// \brief Interface for pulling the occurrencies of the selected categories from one input stream
class PatternExtractorContextInterface
{
public:
	/// \brief Destructor
	virtual ~PatternExtractorContextInterface(){}

	/// \brief Fetch the next match
	/// \param[out] match the match fetched
	/// \return true if a match has been fetched, false at the end of input or on error (error reported in error buffer)
	/// \note Matches are fetched in ascending order of their start offset and they do not overlap.
	///	At every position the longest match is taken, equally long matches are decided by the order of definition of the categories.
	virtual bool nextMatch( Match& match)=0;
};

} //namespace
#endif

