#ifndef MAILTASK_TEST_MAIL_PROMPT_HPP
#define MAILTASK_TEST_MAIL_PROMPT_HPP

#include <string>

#include <google/protobuf/struct.pb.h>

namespace mailtask::test
{
    inline google::protobuf::Struct makePrompt( const std::string &subject, const std::string &text = "" )
    {
        google::protobuf::Struct prompt;
        ( *prompt.mutable_fields() )["subject"].set_string_value( subject );
        ( *prompt.mutable_fields() )["text"].set_string_value( text );
        return prompt;
    }

    inline std::string fieldOf( const google::protobuf::Struct &data, const std::string &name )
    {
        auto field = data.fields().find( name );
        return field != data.fields().end() ? field->second.string_value() : std::string();
    }
}

#endif // MAILTASK_TEST_MAIL_PROMPT_HPP
