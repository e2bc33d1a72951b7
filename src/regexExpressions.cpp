/*
 * Copyright (c) 2014 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
///\file "regexExpressions.cpp"
///\brief Some functions to handle regex expressions
#include "regexExpressions.hpp"
#include "internationalization.hpp"
#include "errorUtils.hpp"
#include <stdexcept>
#include <cstring>

using namespace pextract;

static bool isLiteral( char ch)
{
	static const char* regexchr = ".|*?+(){}[]^$\\";
	return 0==std::strchr( regexchr, ch);
}

// Skip a bracket expression, si points to the character after the opening '['
static void skipCharClass( char const*& si, const char* se)
{
	if (si < se && *si == '^') ++si;
	if (si < se && *si == ']') ++si;
	for (; si < se; ++si)
	{
		if (*si == ']') return;
		if (*si == '[' && si+1 < se && (si[1] == ':' || si[1] == '.' || si[1] == '='))
		{
			char delim = si[1];
			for (si += 2; si+1 < se && !(si[0] == delim && si[1] == ']'); ++si){}
			if (si+1 >= se) break;
			++si;
		}
		else if (*si == '\\')
		{
			++si;
		}
	}
	throw pextract::runtime_error(_TXT("missing close bracket ']' in expression"));
}

// Skip a bracketed sub expression, si points to the character after the opening bracket
static void skipBracket( char eb, char const*& si, const char* se)
{
	for(; si < se; ++si)
	{
		if (*si == eb) return;
		if (*si == '\\')
		{
			++si;
		}
		else if (*si == '[')
		{
			++si;
			skipCharClass( si, se);
		}
		else if (*si == '(')
		{
			++si;
			skipBracket( ')', si, se);
		}
		else if (*si == '{')
		{
			++si;
			skipBracket( '}', si, se);
		}
	}
	throw pextract::runtime_error(_TXT("missing close bracket '%c' in expression"), eb);
}

// Skip one unit of an expression without its quantifier
static void skipUnit( char const*& si, const char* se)
{
	if (*si == '\\')
	{
		si += 2;
		if (si > se) throw pextract::runtime_error(_TXT("unexpected end of expression"));
	}
	else if (*si == '[')
	{
		++si;
		skipCharClass( si, se);
		++si;
	}
	else if (*si == '(')
	{
		++si;
		skipBracket( ')', si, se);
		++si;
	}
	else
	{
		++si;
	}
}

bool pextract::hasTopLevelAlternative( const std::string& expr)
{
	char const* si = expr.c_str();
	const char* se = si + expr.size();
	while (si < se)
	{
		if (*si == '|') return true;
		if (*si == '{')
		{
			++si;
			skipBracket( '}', si, se);
			++si;
		}
		else
		{
			skipUnit( si, se);
		}
	}
	return false;
}

bool pextract::isSingleUnitExpression( const std::string& expr)
{
	if (expr.empty()) return false;
	char const* si = expr.c_str();
	const char* se = si + expr.size();
	if (*si == '|' || *si == ')' || *si == '{' || *si == '*' || *si == '+' || *si == '?' || *si == '^' || *si == '$')
	{
		return false;
	}
	skipUnit( si, se);
	return si == se;
}

std::string pextract::escapeLiteral( const std::string& text)
{
	std::string rt;
	std::string::const_iterator ti = text.begin(), te = text.end();
	for (; ti != te; ++ti)
	{
		if (!isLiteral( *ti))
		{
			rt.push_back( '\\');
		}
		rt.push_back( *ti);
	}
	return rt;
}

