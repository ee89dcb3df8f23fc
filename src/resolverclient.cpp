#include "resolverclient.hpp"
#include "tcpv4client.hpp"
#include "udpv4client.hpp"
#include <algorithm>
#include <boost/log/trivial.hpp>
#include <sstream>

namespace dnssec
{
    MessageInfo ResolverClient::generateQuery( const Domainname &qname, Type qtype )
    {
        MessageInfo query;
        query.mID               = mRandom.rand( 0xffff );
        query.mOpcode           = OPCODE_QUERY;
        query.mQueryResponse    = false;
        query.mRecursionDesired = true;
        query.mCheckingDisabled = true;

        QuestionSectionEntry question;
        question.mDomainname = qname;
        question.mType       = qtype;
        question.mClass      = CLASS_IN;
        query.pushQuestionSection( question );

        query.mIsEDNS0                  = true;
        query.mOptPseudoRR.mPayloadSize = EDNS_PAYLOAD_SIZE;
        query.mOptPseudoRR.mDOBit       = true;

        return query;
    }

    MessageInfo ResolverClient::query( const Domainname &qname, Type qtype, unsigned int timeout_msec )
    {
        Deadline    deadline( std::min( mParameters.mTimeoutMSec, timeout_msec ) );
        MessageInfo query    = generateQuery( qname, qtype );
        MessageInfo response = queryUDP( query, deadline );

        if ( response.mTruncation && mParameters.mTCPFallback ) {
            BOOST_LOG_TRIVIAL( debug ) << "dnssec.resolver: truncated response for " << qname << " "
                                       << typeCodeToString( qtype ) << ", retry over TCP";
            query.mID = mRandom.rand( 0xffff );
            response  = queryTCP( query, deadline );
        }

        return response;
    }

    MessageInfo ResolverClient::queryUDP( const MessageInfo &query, const Deadline &deadline )
    {
        udpv4::Client udp(
            udpv4::ClientParameters( mParameters.mAddress, mParameters.mPort, deadline.getRemainingMSec() ) );

        WireFormat message;
        query.generateMessage( message );
        udp.sendPacket( message );

        // drop datagrams that do not answer this query, the timeout is not restarted
        while ( true ) {
            udpv4::PacketInfo packet   = udp.receivePacket();
            MessageInfo       response = parseDNSMessage( packet.begin(), packet.end() );
            if ( response.mID != query.mID ) {
                BOOST_LOG_TRIVIAL( debug ) << "dnssec.resolver: unexpected message id " << response.mID;
                continue;
            }
            checkResponse( query, response );
            return response;
        }
    }

    MessageInfo ResolverClient::queryTCP( const MessageInfo &query, const Deadline &deadline )
    {
        if ( deadline.isExpired() )
            throw TimeoutError( "no time left for TCP query to " + mParameters.mAddress );
        tcpv4::Client tcp(
            tcpv4::ClientParameters( mParameters.mAddress, mParameters.mPort, deadline.getRemainingMSec() ) );
        tcp.openSocket();

        WireFormat message;
        query.generateMessage( message );

        WireFormat stream;
        stream.pushUInt16HtoN( message.size() );
        stream.pushBuffer( message );
        tcp.send( stream );

        tcpv4::ConnectionInfo length_field = tcp.receive_data( 2 );
        uint16_t response_size = ( length_field.mStream[ 0 ] << 8 ) + length_field.mStream[ 1 ];
        tcpv4::ConnectionInfo data = tcp.receive_data( response_size );
        tcp.closeSocket();

        MessageInfo response = parseDNSMessage( data.begin(), data.end() );
        if ( response.mID != query.mID ) {
            std::ostringstream os;
            os << "unexpected message id " << response.mID << " over TCP";
            throw FormatError( os.str() );
        }
        checkResponse( query, response );
        return response;
    }

    void ResolverClient::checkResponse( const MessageInfo &query, const MessageInfo &response ) const
    {
        if ( !response.mQueryResponse )
            throw FormatError( "received message is not a response" );
        if ( response.getQuestionSection().size() != 1 )
            throw FormatError( "response does not have exactly one question" );

        const QuestionSectionEntry &q = query.getQuestionSection()[ 0 ];
        const QuestionSectionEntry &r = response.getQuestionSection()[ 0 ];
        if ( q.mDomainname != r.mDomainname || q.mType != r.mType || q.mClass != r.mClass )
            throw FormatError( "question of response does not match the query" );
    }
}
