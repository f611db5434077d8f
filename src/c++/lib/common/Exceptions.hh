//
// ReadSim - Empirical Short Read Simulator
// Copyright (c) 2009-2018 Illumina, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.
//
//

/**
 ** \file
 ** \brief Declaration of the common exception mechanism.
 **
 ** All exceptions must carry the same data (independently of the
 ** exception type) to homogenize the reporting and processing of
 ** errors.
 **
 ** \author Come Raczy
 **/

#pragma once


#include "blt_util/thirdparty_push.h"

#include "boost/cerrno.hpp"
#include "boost/exception/all.hpp"
#include "boost/throw_exception.hpp"

#include "blt_util/thirdparty_pop.h"

#include <ios>
#include <stdexcept>
#include <string>

namespace readsim
{
namespace common
{

/**
 ** \brief Virtual base class to all the exception classes
 **
 ** Use BOOST_THROW_EXCEPTION to get the context info (file, function, line)
 ** at the throw site.
 **/
class ExceptionData : public boost::exception
{
public:
    ExceptionData(int errorNumber=0, const std::string& message="");
    ExceptionData(const ExceptionData&) = default;
    ExceptionData& operator=(const ExceptionData&) = delete;

    int getErrorNumber() const
    {
        return errorNumber_;
    }
    const std::string& getMessage() const
    {
        return message_;
    }
    std::string getContext() const;
private:
    const int errorNumber_;
    const std::string message_;
};

/**
 * \brief Exception thrown when there are problems with the IO operations
 */
class IoException: public std::ios_base::failure, public ExceptionData
{
public:
    IoException(int errorNumber, const std::string& message);
};

/**
 ** \brief Exception thrown when the client supplied an invalid parameter.
 **
 **/
class InvalidParameterException: public std::logic_error, public ExceptionData
{
public:
    explicit
    InvalidParameterException(const std::string& message);
};

/**
 ** \brief Exception thrown when a method invocation violates the pre-conditions.
 **
 **/
class PreConditionException: public std::logic_error, public ExceptionData
{
public:
    explicit
    PreConditionException(const std::string& message);
};

/**
 ** \brief Exception thrown when a quality profile file is malformed.
 **
 ** Raised for non-sequential position counters, value/count line pairs which
 ** disagree, unrecognized base symbols and incomplete symbol coverage.
 **/
class ProfileFormatException: public std::runtime_error, public ExceptionData
{
public:
    explicit
    ProfileFormatException(const std::string& message);
};

/**
 ** \brief Exception thrown when a requested read length exceeds the
 ** positions covered by a quality profile.
 **/
class ReadLengthException: public std::logic_error, public ExceptionData
{
public:
    explicit
    ReadLengthException(const std::string& message);
};

/**
 ** \brief Exception thrown when indel positions could not be placed within
 ** the retry budget.
 **/
class IndelSamplingException: public std::runtime_error, public ExceptionData
{
public:
    explicit
    IndelSamplingException(const std::string& message);
};

/// General purpose exception for all other cases:
///
struct GeneralException: public std::runtime_error, public ExceptionData
{
    explicit
    GeneralException(const std::string& message) :
        std::runtime_error(message),
        ExceptionData(EPERM, message)
    {}
};

}
}
