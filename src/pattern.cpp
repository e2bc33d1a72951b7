/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Immutable pattern definitions and the combinators to build them
/// \file "pattern.cpp"
#include "pextract/pattern.hpp"
#include "regexExpressions.hpp"
#include "internationalization.hpp"
#include "errorUtils.hpp"
#include <sstream>
#include <stdexcept>

using namespace pextract;

struct Pattern::Node
{
	Kind kind;
	std::string name;
	std::string expression;
	std::vector<Pattern> constituents;
	unsigned int min;
	unsigned int max;
	PatternBoundary boundary;
	Validation validation;

	Node()
		:kind(Undefined),name(),expression(),constituents(),min(0),max(0),boundary(),validation(NoValidation){}
	Node( Kind kind_, const std::string& expression_, const std::vector<Pattern>& constituents_, unsigned int min_=1, unsigned int max_=1)
		:kind(kind_),name(),expression(expression_),constituents(constituents_),min(min_),max(max_),boundary(),validation(NoValidation){}
	Node( const Node& o)
		:kind(o.kind),name(o.name),expression(o.expression),constituents(o.constituents)
		,min(o.min),max(o.max),boundary(o.boundary),validation(o.validation){}
};

static const std::string& emptyString()
{
	static const std::string rt;
	return rt;
}

static const std::vector<Pattern>& emptyPatternList()
{
	static const std::vector<Pattern> rt;
	return rt;
}

static const PatternBoundary& emptyBoundary()
{
	static const PatternBoundary rt;
	return rt;
}

Pattern::Pattern()
	:m_node(){}

Pattern::Pattern( Node* node_)
	:m_node(node_){}

Pattern::Pattern( const Pattern& o)
	:m_node(o.m_node){}

Pattern& Pattern::operator=( const Pattern& o)
{
	m_node = o.m_node;
	return *this;
}

Pattern::~Pattern(){}

bool Pattern::defined() const
{
	return m_node.get() != 0;
}

Pattern::Kind Pattern::kind() const
{
	return m_node.get() ? m_node->kind : Undefined;
}

const std::string& Pattern::name() const
{
	return m_node.get() ? m_node->name : emptyString();
}

const std::string& Pattern::expression() const
{
	return m_node.get() ? m_node->expression : emptyString();
}

const std::vector<Pattern>& Pattern::constituents() const
{
	return m_node.get() ? m_node->constituents : emptyPatternList();
}

unsigned int Pattern::minOccurrence() const
{
	return m_node.get() ? m_node->min : 0;
}

unsigned int Pattern::maxOccurrence() const
{
	return m_node.get() ? m_node->max : 0;
}

const PatternBoundary& Pattern::boundary() const
{
	return m_node.get() ? m_node->boundary : emptyBoundary();
}

Pattern::Validation Pattern::validation() const
{
	return m_node.get() ? m_node->validation : NoValidation;
}

Pattern Pattern::named( const std::string& name_) const
{
	if (!m_node.get()) throw pextract::runtime_error(_TXT("cannot assign name '%s' to an undefined pattern"), name_.c_str());
	Node* nd = new Node( *m_node);
	nd->name = name_;
	return Pattern( nd);
}

static std::string quantifier( unsigned int min, unsigned int max)
{
	if (min == 0 && max == 1) return "?";
	if (max == 0)
	{
		if (min == 0) return "*";
		if (min == 1) return "+";
	}
	std::ostringstream out;
	out << "{" << min;
	if (max == 0)
	{
		out << ",";
	}
	else if (max != min)
	{
		out << "," << max;
	}
	out << "}";
	return out.str();
}

// Expression of a pattern that can be concatenated with others without changing its meaning
static std::string concatenableExpression( const Pattern& pattern)
{
	std::string rt = pattern.regex();
	if (pattern.kind() == Pattern::Atomic && hasTopLevelAlternative( rt))
	{
		rt = std::string("(") + rt + ")";
	}
	return rt;
}

std::string Pattern::regex() const
{
	switch (kind())
	{
		case Undefined:
			throw pextract::runtime_error(_TXT("accessing expression of an undefined pattern"));
		case Atomic:
			return m_node->expression;
		case Union:
		{
			std::string rt( "(");
			std::vector<Pattern>::const_iterator ci = m_node->constituents.begin(), ce = m_node->constituents.end();
			for (int cidx=0; ci != ce; ++ci,++cidx)
			{
				if (cidx) rt.push_back( '|');
				rt.append( ci->regex());
			}
			rt.push_back( ')');
			return rt;
		}
		case Sequence:
		{
			std::string rt;
			std::vector<Pattern>::const_iterator ci = m_node->constituents.begin(), ce = m_node->constituents.end();
			for (; ci != ce; ++ci)
			{
				rt.append( concatenableExpression( *ci));
			}
			return rt;
		}
		case Repetition:
		{
			std::string unit = m_node->constituents[0].regex();
			if (!isSingleUnitExpression( unit))
			{
				unit = std::string("(") + unit + ")";
			}
			return unit + quantifier( m_node->min, m_node->max);
		}
	}
	throw pextract::runtime_error(_TXT("corrupt pattern structure"));
}

static void checkConstituents( const std::vector<Pattern>& constituents, const char* operation)
{
	if (constituents.empty())
	{
		throw pextract::runtime_error(_TXT("no arguments passed to %s"), operation);
	}
	std::vector<Pattern>::const_iterator ci = constituents.begin(), ce = constituents.end();
	for (; ci != ce; ++ci)
	{
		if (!ci->defined()) throw pextract::runtime_error(_TXT("undefined pattern passed to %s"), operation);
	}
}

Pattern pextract::atom( const std::string& expression)
{
	if (expression.empty())
	{
		throw pextract::runtime_error(_TXT("empty expression passed to %s"), "atom");
	}
	return Pattern( new Pattern::Node( Pattern::Atomic, expression, std::vector<Pattern>()));
}

Pattern pextract::literal( const std::string& text)
{
	return atom( escapeLiteral( text));
}

Pattern pextract::unite( const std::vector<Pattern>& alternatives)
{
	checkConstituents( alternatives, "unite");
	if (alternatives.size() == 1) return alternatives[0];
	return Pattern( new Pattern::Node( Pattern::Union, std::string(), alternatives));
}

Pattern pextract::unite( const Pattern& p1, const Pattern& p2)
{
	std::vector<Pattern> ar;
	ar.push_back( p1);
	ar.push_back( p2);
	return unite( ar);
}

Pattern pextract::unite( const Pattern& p1, const Pattern& p2, const Pattern& p3)
{
	std::vector<Pattern> ar;
	ar.push_back( p1);
	ar.push_back( p2);
	ar.push_back( p3);
	return unite( ar);
}

Pattern pextract::unite( const Pattern& p1, const Pattern& p2, const Pattern& p3, const Pattern& p4)
{
	std::vector<Pattern> ar;
	ar.push_back( p1);
	ar.push_back( p2);
	ar.push_back( p3);
	ar.push_back( p4);
	return unite( ar);
}

Pattern pextract::sequence( const std::vector<Pattern>& parts)
{
	checkConstituents( parts, "sequence");
	if (parts.size() == 1) return parts[0];
	return Pattern( new Pattern::Node( Pattern::Sequence, std::string(), parts));
}

Pattern pextract::sequence( const Pattern& p1, const Pattern& p2)
{
	std::vector<Pattern> ar;
	ar.push_back( p1);
	ar.push_back( p2);
	return sequence( ar);
}

Pattern pextract::sequence( const Pattern& p1, const Pattern& p2, const Pattern& p3)
{
	std::vector<Pattern> ar;
	ar.push_back( p1);
	ar.push_back( p2);
	ar.push_back( p3);
	return sequence( ar);
}

Pattern pextract::sequence( const Pattern& p1, const Pattern& p2, const Pattern& p3, const Pattern& p4)
{
	std::vector<Pattern> ar;
	ar.push_back( p1);
	ar.push_back( p2);
	ar.push_back( p3);
	ar.push_back( p4);
	return sequence( ar);
}

Pattern pextract::sequence( const Pattern& p1, const Pattern& p2, const Pattern& p3, const Pattern& p4, const Pattern& p5)
{
	std::vector<Pattern> ar;
	ar.push_back( p1);
	ar.push_back( p2);
	ar.push_back( p3);
	ar.push_back( p4);
	ar.push_back( p5);
	return sequence( ar);
}

Pattern pextract::repeat( const Pattern& pattern, unsigned int min, unsigned int max)
{
	if (!pattern.defined())
	{
		throw pextract::runtime_error(_TXT("undefined pattern passed to %s"), "repeat");
	}
	if (max != 0 && min > max)
	{
		throw pextract::runtime_error(_TXT("illegal range {%u,%u} passed to %s"), min, max, "repeat");
	}
	if (min == 1 && max == 1) return pattern;
	return Pattern( new Pattern::Node( Pattern::Repetition, std::string(), std::vector<Pattern>( 1, pattern), min, max));
}

Pattern pextract::optional( const Pattern& pattern)
{
	return repeat( pattern, 0, 1);
}

Pattern pextract::bounded( const Pattern& pattern, const PatternBoundary& boundary)
{
	if (!pattern.defined())
	{
		throw pextract::runtime_error(_TXT("undefined pattern passed to %s"), "bounded");
	}
	Pattern::Node* nd = new Pattern::Node( *pattern.m_node);
	nd->boundary = boundary;
	return Pattern( nd);
}

Pattern pextract::validated( const Pattern& pattern, Pattern::Validation validation)
{
	if (!pattern.defined())
	{
		throw pextract::runtime_error(_TXT("undefined pattern passed to %s"), "validated");
	}
	Pattern::Node* nd = new Pattern::Node( *pattern.m_node);
	nd->validation = validation;
	return Pattern( nd);
}

