// SPDX-License-Identifier: LGPL-2.1-or-later

#include "exception.hxx"

#include <sstream>

////////////////////////////////////////////////////////////////////////
// Implementation of av_location class.
////////////////////////////////////////////////////////////////////////

av_location::av_location()
    : _token(-1),
      _column(-1)
{
}

av_location::av_location(int token, int column)
    : _token(token),
      _column(column)
{
}

std::string av_location::asString() const
{
    std::ostringstream out;
    if (_token >= 0)
        out << "token " << _token;
    if (_column >= 0) {
        if (_token >= 0)
            out << ", ";
        out << "column " << _column;
    }
    return out.str();
}


////////////////////////////////////////////////////////////////////////
// Implementation of av_throwable class.
////////////////////////////////////////////////////////////////////////

av_throwable::av_throwable()
{
}

av_throwable::av_throwable(const std::string& message, const std::string& origin)
    : _message(message),
      _origin(origin)
{
    _what = getFormattedMessage();
}

void av_throwable::setMessage(const std::string& message)
{
    _message = message;
    _what = getFormattedMessage();
}

void av_throwable::setOrigin(const std::string& origin)
{
    _origin = origin;
    _what = getFormattedMessage();
}

const std::string av_throwable::getFormattedMessage() const
{
    if (_origin.empty())
        return _message;
    return _message + " (from " + _origin + ")";
}

const char* av_throwable::what() const noexcept
{
    return _what.c_str();
}


////////////////////////////////////////////////////////////////////////
// Implementation of the concrete exceptions.
////////////////////////////////////////////////////////////////////////

av_exception::av_exception(const std::string& message, const std::string& origin)
    : av_throwable(message, origin)
{
}

av_format_exception::av_format_exception(const std::string& message, const std::string& text,
                                         const av_location& location,
                                         const std::string& origin)
    : av_exception(message, origin),
      _reason(message),
      _text(text),
      _location(location)
{
    buildMessage();
}

void av_format_exception::setLocation(const av_location& location)
{
    _location = location;
    buildMessage();
}

void av_format_exception::buildMessage()
{
    std::string m = _reason;
    if (!_text.empty())
        m += " '" + _text + "'";
    if (_location.isValid())
        m += " at " + _location.asString();
    setMessage(m);
}

av_range_exception::av_range_exception(const std::string& message, const std::string& origin)
    : av_exception(message, origin)
{
}

av_empty_input_exception::av_empty_input_exception(const std::string& origin)
    : av_exception("empty report", origin)
{
}

av_missing_station_exception::av_missing_station_exception(const std::string& text,
                                                           const av_location& location,
                                                           const std::string& origin)
    : av_format_exception("station identifier missing or malformed", text, location, origin)
{
}

av_missing_time_exception::av_missing_time_exception(const std::string& text,
                                                     const av_location& location,
                                                     const std::string& origin)
    : av_format_exception("report time missing", text, location, origin)
{
}

av_malformed_time_exception::av_malformed_time_exception(const std::string& message,
                                                         const std::string& text,
                                                         const av_location& location)
    : av_format_exception(message, text, location)
{
}

av_malformed_field_exception::av_malformed_field_exception(const std::string& field,
                                                           const std::string& message,
                                                           const std::string& text,
                                                           const av_location& location)
    : av_format_exception(field + ": " + message, text, location),
      _field(field)
{
}
