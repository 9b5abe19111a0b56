// Licensed under the Apache License, Version 2.0 (the "License"); you may not
// use this file except in compliance with the License. You may obtain a copy of
// the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS, WITHOUT
// WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied. See the
// License for the specific language governing permissions and limitations under
// the License.

#ifndef GEORANGE_EXCEPTION_HH
#define GEORANGE_EXCEPTION_HH


#include <exception>
#include <string>
#include <sstream>

#include "georange.hh"


NS_GEORANGE_BEGIN


class GeorangeException: public std::exception
{
    public:
        explicit GeorangeException(const char* msg) {
            this->reason = msg;
        }

        explicit GeorangeException(std::string msg) {
            this->reason = msg;
        }

        virtual ~GeorangeException() throw() {}

        virtual const char* what() const throw() {
            return this->reason.c_str();
        };

    protected:
        std::string reason;
};


class GeorangeExit: public std::exception
{
    public:
        GeorangeExit(int code) {
            std::stringstream ss;
            ss << "GeorangeExit: " << code;
            this->reason = ss.str();
            this->code = code;
        }

        virtual ~GeorangeExit() throw() {}

        virtual const char* what() const throw() {
            return this->reason.c_str();
        }

        std::string reason;
        int code;
};


// Raised when something that can only come from our own
// output turns out to be malformed.
class InvariantViolation: public std::exception
{
    public:
        InvariantViolation(std::string msg) {
            this->msg = "Invariant violation: " + msg;
        }

        virtual ~InvariantViolation() throw() {}

        virtual const char* what() const throw() {
            return this->msg.c_str();
        }

        std::string msg;
};


class GeoException: public std::exception
{
    public:
        GeoException(const char* msg) {
            this->msg = msg;
        }

        GeoException(std::string msg) {
            this->msg = msg;
        }

        virtual ~GeoException() throw() {}

        virtual const char* what() const throw() {
            return this->msg.c_str();
        }

        std::string msg;
};


NS_GEORANGE_END


#endif
