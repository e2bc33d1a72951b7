/*
 * Copyright (c) 2014 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
///\file "regexExpressions.hpp"
///\brief Some functions to handle regex expressions
#ifndef _PEXTRACT_REGEX_EXPRESSIONS_HPP_INCLUDED
#define _PEXTRACT_REGEX_EXPRESSIONS_HPP_INCLUDED
#include <string>

namespace pextract
{

/// \brief Evaluate if an expression has an alternative '|' not enclosed in brackets
bool hasTopLevelAlternative( const std::string& expr);

/// \brief Evaluate if an expression is a single unit a quantifier can be appended to without brackets
/// \note A unit is a character, an escaped character, a bracket expression or an expression enclosed in brackets
bool isSingleUnitExpression( const std::string& expr);

/// \brief Escape all characters with a special meaning in regular expressions
std::string escapeLiteral( const std::string& text);

}
#endif

