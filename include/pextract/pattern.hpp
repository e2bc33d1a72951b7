/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Immutable pattern definitions and the combinators to build them
/// \file "pattern.hpp"
#ifndef _PEXTRACT_PATTERN_HPP_INCLUDED
#define _PEXTRACT_PATTERN_HPP_INCLUDED
#include "strus/reference.hpp"
#include <string>
#include <vector>

namespace pextract {

/// \brief Context rule of a pattern describing what must not precede or follow a match
/// \note Character sets are specified as content of a bracket expression without the brackets, e.g. "A-Za-z0-9_"
class PatternBoundary
{
public:
	/// \brief Default constructor (no boundary)
	PatternBoundary()
		:m_left(),m_right(),m_rightContext(){}
	/// \brief Constructor
	/// \param[in] left_ set of characters that must not precede a match (empty for none)
	/// \param[in] right_ set of characters that must not follow a match (empty for none)
	/// \param[in] rightContext_ expression that must follow a match, overrides right_ if not empty
	PatternBoundary( const std::string& left_, const std::string& right_, const std::string& rightContext_=std::string())
		:m_left(left_),m_right(right_),m_rightContext(rightContext_){}
	/// \brief Copy constructor
	PatternBoundary( const PatternBoundary& o)
		:m_left(o.m_left),m_right(o.m_right),m_rightContext(o.m_rightContext){}

	/// \brief Boundary with the same set of characters forbidden on both sides
	static PatternBoundary notAdjacent( const std::string& charset)
	{
		return PatternBoundary( charset, charset);
	}

	/// \brief Set of characters that must not precede a match
	const std::string& left() const			{return m_left;}
	/// \brief Set of characters that must not follow a match
	const std::string& right() const		{return m_right;}
	/// \brief Expression that must follow a match
	const std::string& rightContext() const		{return m_rightContext;}

	/// \brief Evaluate if any context rule is defined
	bool defined() const
	{
		return !m_left.empty() || !m_right.empty() || !m_rightContext.empty();
	}

private:
	std::string m_left;
	std::string m_right;
	std::string m_rightContext;
};


/// \brief Immutable grammar node, either an atomic regular expression or a composition of other patterns
/// \note Copies share the same node. A pattern can only be composed of patterns built before, so the structure is a DAG
/// \note Atomic expressions have to be written in the subset of regular expression syntax understood by both PCRE and POSIX extended regular expressions
class Pattern
{
public:
	/// \brief Type of the grammar node
	enum Kind
	{
		Undefined,		///< empty pattern object, returned as error value
		Atomic,			///< regular expression
		Union,			///< alternative of the constituents
		Sequence,		///< concatenation of the constituents
		Repetition		///< repetition of the single constituent
	};
	/// \brief Additional check applied on the text matched
	enum Validation
	{
		NoValidation,		///< shape only
		LuhnChecksum		///< digits have to pass the Luhn checksum test (only if enabled)
	};

	/// \brief Default constructor, creates an undefined pattern
	Pattern();
	/// \brief Copy constructor
	Pattern( const Pattern& o);
	/// \brief Assignment
	Pattern& operator=( const Pattern& o);
	/// \brief Destructor
	~Pattern();

	/// \brief Evaluate if the pattern is defined
	bool defined() const;
	/// \brief Kind of the grammar node
	Kind kind() const;
	/// \brief Name of the pattern, empty for anonymous building blocks
	const std::string& name() const;
	/// \brief Regular expression of an atomic pattern
	const std::string& expression() const;
	/// \brief Constituents of a composite pattern
	const std::vector<Pattern>& constituents() const;
	/// \brief Minimum number of occurrencies of a repetition
	unsigned int minOccurrence() const;
	/// \brief Maximum number of occurrencies of a repetition, 0 for unbounded
	unsigned int maxOccurrence() const;
	/// \brief Context rule of the pattern
	const PatternBoundary& boundary() const;
	/// \brief Additional check of the text matched
	Validation validation() const;

	/// \brief Get the regular expression matching this pattern without its own boundary
	/// \note Boundaries of constituents are not part of the expression
	std::string regex() const;

	/// \brief Get a copy of this pattern with a name assigned
	Pattern named( const std::string& name_) const;

private:
	friend Pattern atom( const std::string& expression);
	friend Pattern unite( const std::vector<Pattern>& alternatives);
	friend Pattern sequence( const std::vector<Pattern>& parts);
	friend Pattern repeat( const Pattern& pattern, unsigned int min, unsigned int max);
	friend Pattern bounded( const Pattern& pattern, const PatternBoundary& boundary);
	friend Pattern validated( const Pattern& pattern, Pattern::Validation validation);

	struct Node;
	explicit Pattern( Node* node_);

	strus::Reference<Node> m_node;
};

/// \brief Create an atomic pattern from a regular expression
Pattern atom( const std::string& expression);
/// \brief Create an atomic pattern matching a literal text (characters with a special meaning in regular expressions are escaped)
Pattern literal( const std::string& text);

/// \brief Create a pattern matching anything any of the alternatives match
Pattern unite( const std::vector<Pattern>& alternatives);
Pattern unite( const Pattern& p1, const Pattern& p2);
Pattern unite( const Pattern& p1, const Pattern& p2, const Pattern& p3);
Pattern unite( const Pattern& p1, const Pattern& p2, const Pattern& p3, const Pattern& p4);

/// \brief Create a pattern matching the concatenation of the parts
Pattern sequence( const std::vector<Pattern>& parts);
Pattern sequence( const Pattern& p1, const Pattern& p2);
Pattern sequence( const Pattern& p1, const Pattern& p2, const Pattern& p3);
Pattern sequence( const Pattern& p1, const Pattern& p2, const Pattern& p3, const Pattern& p4);
Pattern sequence( const Pattern& p1, const Pattern& p2, const Pattern& p3, const Pattern& p4, const Pattern& p5);

/// \brief Create a pattern matching between min and max repetitions of a pattern
/// \param[in] max maximum number of repetitions, 0 for unbounded
Pattern repeat( const Pattern& pattern, unsigned int min, unsigned int max);
/// \brief Create a pattern matching the pattern or nothing
Pattern optional( const Pattern& pattern);

/// \brief Get a copy of a pattern with a context rule attached
Pattern bounded( const Pattern& pattern, const PatternBoundary& boundary);
/// \brief Get a copy of a pattern with a validation of the matched text attached
Pattern validated( const Pattern& pattern, Pattern::Validation validation);

} //namespace
#endif

