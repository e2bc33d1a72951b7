/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Interface for selecting the categories to extract and building the automaton for them
/// \file "patternExtractorInstanceInterface.hpp"
#ifndef _PEXTRACT_PATTERN_EXTRACTOR_INSTANCE_INTERFACE_HPP_INCLUDED
#define _PEXTRACT_PATTERN_EXTRACTOR_INSTANCE_INTERFACE_HPP_INCLUDED
#include <string>
#include <vector>
#include <iosfwd>

namespace pextract
{

/// \brief Forward declaration
class PatternExtractorContextInterface;

/// \brief Interface for selecting the categories to extract and building the automaton for them
class PatternExtractorInstanceInterface
{
public:
	/// \brief Destructor
	virtual ~PatternExtractorInstanceInterface(){}

	/// \brief Select a category to extract
	/// \param[in] name name of the category as defined in the registry
	/// \note An unknown name is reported as error immediately and makes 'compile()' fail
	/// \note If no category is selected, all categories of the registry are used
	virtual void selectCategory( const std::string& name)=0;

	/// \brief Define an additional ad hoc pattern reported with the category name "custom"
	/// \param[in] expression regular expression of the pattern
	/// \note A malformed expression is reported as error immediately and makes 'compile()' fail
	virtual void defineCustomPattern( const std::string& expression)=0;

	/// \brief Define an option influencing the compilation of the selected patterns
	/// \param[in] name name of the option (see PatternExtractorInterface::getCompileOptionNames())
	/// \param[in] value value of the option, 0 for disabling it
	virtual void defineOption( const std::string& name, double value)=0;

	/// \brief Compile the selected categories
	/// \return true on success, false on error (error reported in error buffer)
	/// \remark This function has to be called before calling 'createContext(std::istream&)'
	virtual bool compile()=0;

	/// \brief Get the names of the categories compiled in the order they are prioritized
	virtual std::vector<std::string> selectedCategories() const=0;

	/// \brief Create the context to extract the matches from one input stream
	/// \param[in] input input stream (reference, not owned, has to live as long as the context)
	/// \return the context (with ownership) or NULL on error (error reported in error buffer)
	/// \remark The context cannot be reset. It has to be recreated for every input
	virtual PatternExtractorContextInterface* createContext( std::istream& input) const=0;
};

} //namespace
#endif

