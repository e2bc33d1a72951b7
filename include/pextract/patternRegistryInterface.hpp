/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Interface for the table of named patterns that can be selected as categories for extraction
/// \file "patternRegistryInterface.hpp"
#ifndef _PEXTRACT_PATTERN_REGISTRY_INTERFACE_HPP_INCLUDED
#define _PEXTRACT_PATTERN_REGISTRY_INTERFACE_HPP_INCLUDED
#include "pextract/pattern.hpp"
#include <string>
#include <vector>

namespace pextract
{

/// \brief Interface for the table of named patterns (categories)
/// \note After calling 'done()' the registry is read only and can be shared between threads
class PatternRegistryInterface
{
public:
	/// \brief Destructor
	virtual ~PatternRegistryInterface(){}

	/// \brief Define a named pattern
	/// \param[in] name unique name of the pattern
	/// \param[in] pattern definition of the pattern
	/// \return true on success, false on error (error reported in error buffer)
	/// \note Fails if the name is already defined, if the pattern can match an empty string or if 'done()' has been called
	virtual bool definePattern(
			const std::string& name,
			const Pattern& pattern)=0;

	/// \brief Evaluate if a pattern with a name is defined
	/// \param[in] name name of the pattern
	virtual bool isDefined( const std::string& name) const=0;

	/// \brief Get a pattern by name
	/// \param[in] name name of the pattern
	/// \return the pattern or an undefined pattern (Pattern::defined() returns false) if not found (error reported in error buffer)
	virtual Pattern resolve( const std::string& name) const=0;

	/// \brief Get the index of a pattern in the order of definition
	/// \param[in] name name of the pattern
	/// \return the index starting with 1 or 0 if not found
	virtual unsigned int definitionIndex( const std::string& name) const=0;

	/// \brief Get the list of all pattern names in the order of their definition
	virtual std::vector<std::string> listCategories() const=0;

	/// \brief Close the definition phase, the registry is immutable afterwards
	virtual void done()=0;
};

} //namespace
#endif

