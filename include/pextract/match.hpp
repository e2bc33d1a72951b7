/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Structure describing one occurrence of a pattern found in the input
/// \file "match.hpp"
#ifndef _PEXTRACT_MATCH_HPP_INCLUDED
#define _PEXTRACT_MATCH_HPP_INCLUDED
#include <string>
#include <cstddef>

namespace pextract {

/// \brief Structure describing one located occurrence of a category in the input
/// \note Positions are byte offsets in the input, the span is [start,end)
class Match
{
public:
	/// \brief Default constructor
	Match()
		:m_category(),m_start(0),m_end(0),m_text(){}
	/// \brief Constructor
	Match( const std::string& category_, std::size_t start_, std::size_t end_, const std::string& text_)
		:m_category(category_),m_start(start_),m_end(end_),m_text(text_){}
	/// \brief Copy constructor
	Match( const Match& o)
		:m_category(o.m_category),m_start(o.m_start),m_end(o.m_end),m_text(o.m_text){}
	/// \brief Destructor
	~Match(){}

	/// \brief Name of the selected category that matched
	const std::string& category() const		{return m_category;}
	/// \brief Byte offset of the first character of the match
	std::size_t start() const			{return m_start;}
	/// \brief Byte offset of the first character after the match
	std::size_t end() const				{return m_end;}
	/// \brief Length of the match in bytes
	std::size_t size() const			{return m_end - m_start;}
	/// \brief Matched bytes
	const std::string& text() const			{return m_text;}

private:
	std::string m_category;
	std::size_t m_start;
	std::size_t m_end;
	std::string m_text;
};

} //namespace
#endif

