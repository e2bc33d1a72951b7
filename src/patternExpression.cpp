/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Translation of patterns into the list of regular expressions passed to the automaton
/// \file "patternExpression.cpp"
#include "patternExpression.hpp"
#include "internationalization.hpp"
#include "errorUtils.hpp"
#include "hs_compile.h"
#include "hs.h"
#include <cstdlib>
#include <stdexcept>

using namespace pextract;

static void appendPatternExpressions( std::vector<ExpressionDef>& res, const Pattern& pattern, Pattern::Validation validation)
{
	if (pattern.validation() != Pattern::NoValidation)
	{
		validation = pattern.validation();
	}
	const PatternBoundary& boundary = pattern.boundary();
	if (boundary.defined())
	{
		std::string expr;
		unsigned int resultIndex = 1;
		if (!boundary.left().empty())
		{
			expr.append( "(^|[^");
			expr.append( boundary.left());
			expr.append( "])");
			resultIndex = 2;
		}
		expr.push_back( '(');
		expr.append( pattern.regex());
		expr.push_back( ')');
		if (!boundary.rightContext().empty())
		{
			expr.push_back( '(');
			expr.append( boundary.rightContext());
			expr.push_back( ')');
		}
		else if (!boundary.right().empty())
		{
			expr.append( "([^");
			expr.append( boundary.right());
			expr.append( "]|$)");
		}
		res.push_back( ExpressionDef( expr, resultIndex, validation));
	}
	else if (pattern.kind() == Pattern::Union)
	{
		std::vector<Pattern>::const_iterator ci = pattern.constituents().begin(), ce = pattern.constituents().end();
		for (; ci != ce; ++ci)
		{
			appendPatternExpressions( res, *ci, validation);
		}
	}
	else
	{
		res.push_back( ExpressionDef( pattern.regex(), 0, validation));
	}
}

std::vector<ExpressionDef> pextract::getPatternExpressions( const Pattern& pattern)
{
	std::vector<ExpressionDef> rt;
	if (!pattern.defined())
	{
		throw pextract::runtime_error(_TXT("cannot build expressions of an undefined pattern"));
	}
	appendPatternExpressions( rt, pattern, Pattern::NoValidation);
	return rt;
}

void pextract::checkExpression( const std::string& expression, unsigned int flags)
{
	hs_expr_info_t* info = 0;
	hs_compile_error_t* compile_err = 0;
	hs_error_t err = hs_expression_info( expression.c_str(), flags, &info, &compile_err);
	if (err != HS_SUCCESS)
	{
		std::string msg = compile_err ? compile_err->message : _TXT("unknown error");
		if (compile_err) hs_free_compile_error( compile_err);
		throw pextract::runtime_error(_TXT("malformed expression \"%s\": %s"), expression.c_str(), msg.c_str());
	}
	unsigned int min_width = info ? info->min_width : 0;
	if (info) std::free( info);
	if (min_width == 0)
	{
		throw pextract::runtime_error(_TXT("expression \"%s\" matches the empty string"), expression.c_str());
	}
}

