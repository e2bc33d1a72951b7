/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Translation of patterns into the list of regular expressions passed to the automaton
/// \file "patternExpression.hpp"
#ifndef _PEXTRACT_PATTERN_EXPRESSION_HPP_INCLUDED
#define _PEXTRACT_PATTERN_EXPRESSION_HPP_INCLUDED
#include "pextract/pattern.hpp"
#include <string>
#include <vector>

namespace pextract {

/// \brief One regular expression of the automaton
struct ExpressionDef
{
	std::string expression;		///< regular expression string
	unsigned int resultIndex;	///< index of the sub expression selecting the match, 0 for the whole match
	Pattern::Validation validation;	///< check of the text matched

	ExpressionDef()
		:expression(),resultIndex(0),validation(Pattern::NoValidation){}
	ExpressionDef( const std::string& expression_, unsigned int resultIndex_, Pattern::Validation validation_)
		:expression(expression_),resultIndex(resultIndex_),validation(validation_){}
	ExpressionDef( const ExpressionDef& o)
		:expression(o.expression),resultIndex(o.resultIndex),validation(o.validation){}
};

/// \brief Get the list of regular expressions that together match a pattern
/// \note A pattern with a boundary becomes one expression with context sub expressions around the result sub expression.
///	A union without boundary is split into the expressions of its alternatives, so that their boundaries are kept.
std::vector<ExpressionDef> getPatternExpressions( const Pattern& pattern);

/// \brief Check an expression with the hyperscan compiler
/// \param[in] expression regular expression string
/// \param[in] flags hyperscan flags the expression is compiled with
/// \note Throws an exception if the expression is malformed or if it can match an empty string
void checkExpression( const std::string& expression, unsigned int flags);

}//namespace
#endif

