#ifndef DNSSEC_LOGGER_HPP
#define DNSSEC_LOGGER_HPP

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/trivial.hpp>
#include <string>

namespace dnssec
{
    namespace logger
    {
        typedef boost::log::trivial::severity_level Level;
        const Level TRACE   = boost::log::trivial::trace;
        const Level DEBUG   = boost::log::trivial::debug;
        const Level INFO    = boost::log::trivial::info;
        const Level WARNING = boost::log::trivial::warning;
        const Level ERROR   = boost::log::trivial::error;
        const Level FATAL   = boost::log::trivial::fatal;

        /*!
         * @throw std::runtime_error unknown level name
         */
        Level toLevel( const std::string &level );

        /*!
         * set severity filter and add a console sink (stderr)
         */
        void initialize( Level level = WARNING );
        void initialize( const std::string &level );
    }
}

#endif
