#ifndef DNSSEC_DNS_HPP
#define DNSSEC_DNS_HPP

#include "domainname.hpp"
#include "utils.hpp"
#include <boost/cstdint.hpp>
#include <cstring>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace dnssec
{
    typedef uint8_t Opcode;
    const Opcode    OPCODE_QUERY = 0;

    typedef uint16_t Class;
    const Class      CLASS_IN  = 1;
    const Class      CLASS_CH  = 3;
    const Class      CLASS_ANY = 255;

    typedef uint16_t Type;
    const Type       TYPE_A      = 1;
    const Type       TYPE_NS     = 2;
    const Type       TYPE_CNAME  = 5;
    const Type       TYPE_SOA    = 6;
    const Type       TYPE_TXT    = 16;
    const Type       TYPE_AAAA   = 28;
    const Type       TYPE_DNAME  = 39;
    const Type       TYPE_OPT    = 41;
    const Type       TYPE_DS     = 43;
    const Type       TYPE_RRSIG  = 46;
    const Type       TYPE_NSEC   = 47;
    const Type       TYPE_DNSKEY = 48;
    const Type       TYPE_NSEC3  = 50;
    const Type       TYPE_TLSA   = 52;
    const Type       TYPE_ANY    = 255;

    typedef uint32_t TTL;

    typedef uint8_t    ResponseCode;
    const ResponseCode NO_ERROR        = 0;
    const ResponseCode FORMAT_ERROR    = 1;
    const ResponseCode SERVER_ERROR    = 2;
    const ResponseCode NXDOMAIN        = 3;
    const ResponseCode NOT_IMPLEMENTED = 4;
    const ResponseCode REFUSED         = 5;

    const uint16_t EDNS_PAYLOAD_SIZE = 4096;

    class RDATA;
    typedef std::shared_ptr<RDATA>       RDATAPtr;
    typedef std::shared_ptr<const RDATA> ConstRDATAPtr;

    class RDATA
    {
    public:
        virtual ~RDATA()
        {
        }

        virtual std::string toZone() const                                  = 0;
        virtual std::string toString() const                                = 0;
        virtual void outputWireFormat( WireFormat &message ) const          = 0;
        virtual void outputCanonicalWireFormat( WireFormat &message ) const = 0;
        virtual Type     type() const                                       = 0;
        virtual uint16_t size() const                                       = 0;
    };

    /*!
     * RDATA of record types which are not interpreted
     */
    class RecordRaw : public RDATA
    {
    private:
        Type                 mRRType;
        std::vector<uint8_t> mData;

    public:
        RecordRaw( Type t, const std::vector<uint8_t> &d ) : mRRType( t ), mData( d )
        {
        }

        virtual std::string toZone() const;
        virtual std::string toString() const;
        virtual void outputWireFormat( WireFormat &message ) const;
        virtual void outputCanonicalWireFormat( WireFormat &message ) const;
        virtual Type type() const
        {
            return mRRType;
        }
        virtual uint16_t size() const
        {
            return mData.size();
        }
        const std::vector<uint8_t> &getData() const
        {
            return mData;
        }
    };

    class RecordSOA : public RDATA
    {
    private:
        Domainname mMName;
        Domainname mRName;
        uint32_t   mSerial;
        uint32_t   mRefresh;
        uint32_t   mRetry;
        uint32_t   mExpire;
        uint32_t   mMinimum;

    public:
        RecordSOA( const Domainname &mname,
                   const Domainname &rname,
                   uint32_t          serial,
                   uint32_t          refresh,
                   uint32_t          retry,
                   uint32_t          expire,
                   uint32_t          minimum );

        virtual std::string toZone() const;
        virtual std::string toString() const;
        virtual void outputWireFormat( WireFormat &message ) const;
        virtual void outputCanonicalWireFormat( WireFormat &message ) const;
        virtual Type type() const
        {
            return TYPE_SOA;
        }
        virtual uint16_t size() const;

        const Domainname &getMName() const { return mMName; }
        const Domainname &getRName() const { return mRName; }
        uint32_t getSerial() const { return mSerial; }
        uint32_t getMinimum() const { return mMinimum; }

        static RDATAPtr parse( const uint8_t *packet_begin, const uint8_t *packet_end, const uint8_t *rdata_begin, const uint8_t *rdata_end );
    };

    class RecordRRSIG : public RDATA
    {
    private:
        Type                 mTypeCovered;
        uint8_t              mAlgorithm;
        uint8_t              mLabelCount;
        uint32_t             mOriginalTTL;
        uint32_t             mExpiration;
        uint32_t             mInception;
        uint16_t             mKeyTag;
        Domainname           mSigner;
        std::vector<uint8_t> mSignature;

    public:
        RecordRRSIG( Type                        t,
                     uint8_t                     algo,
                     uint8_t                     label,
                     uint32_t                    ttl,
                     uint32_t                    expire,
                     uint32_t                    incept,
                     uint16_t                    tag,
                     const Domainname &          sign,
                     const std::vector<uint8_t> &sig )
            : mTypeCovered( t ),
              mAlgorithm( algo ),
              mLabelCount( label ),
              mOriginalTTL( ttl ),
              mExpiration( expire ),
              mInception( incept ),
              mKeyTag( tag ),
              mSigner( sign ),
              mSignature( sig )
        {
        }

        Type     getTypeCovered() const { return mTypeCovered; }
        uint8_t  getAlgorithm() const { return mAlgorithm; }
        uint8_t  getLabelCount() const { return mLabelCount; }
        uint32_t getOriginalTTL() const { return mOriginalTTL; }
        uint32_t getExpiration() const { return mExpiration; }
        uint32_t getInception() const { return mInception; }
        uint16_t getKeyTag() const { return mKeyTag; }
        const Domainname &          getSigner() const { return mSigner; }
        const std::vector<uint8_t> &getSignature() const { return mSignature; }

        /*!
         * RRSIG RDATA without the signature field (RFC 4034 3.1.8.1)
         */
        void outputSignedFields( WireFormat &message ) const;

        virtual std::string toZone() const;
        virtual std::string toString() const;
        virtual void outputWireFormat( WireFormat &message ) const;
        virtual void outputCanonicalWireFormat( WireFormat &message ) const;
        virtual uint16_t size() const
        {
            return 2 + // type covered
                   1 + // algorithm
                   1 + // label count
                   4 + // original ttl
                   4 + // expiration
                   4 + // inception
                   2 + // key tag
                   mSigner.size() + mSignature.size();
        }

        virtual Type type() const
        {
            return TYPE_RRSIG;
        }

        static RDATAPtr parse( const uint8_t *packet_begin, const uint8_t *packet_end, const uint8_t *rdata_begin, const uint8_t *rdata_end );
    };

    class RecordDNSKEY : public RDATA
    {
    private:
        uint16_t             mFlag;
        uint8_t              mProtocol;
        uint8_t              mAlgorithm;
        std::vector<uint8_t> mPublicKey;

    public:
        static const uint16_t ZONE_KEY = 1 << 8;
        static const uint16_t REVOKE   = 1 << 7;
        static const uint16_t SEP      = 1 << 0;

        static const uint16_t KSK = 257;
        static const uint16_t ZSK = 256;

        static const uint8_t PROTOCOL = 3;

        RecordDNSKEY( uint16_t f, uint8_t algo, const std::vector<uint8_t> &key, uint8_t protocol = PROTOCOL )
            : mFlag( f ), mProtocol( protocol ), mAlgorithm( algo ), mPublicKey( key )
        {
        }

        uint16_t getFlag() const { return mFlag; }
        uint8_t  getProtocol() const { return mProtocol; }
        uint8_t  getAlgorithm() const { return mAlgorithm; }
        const std::vector<uint8_t> &getPublicKey() const { return mPublicKey; }

        bool isZoneKey() const { return mFlag & ZONE_KEY; }
        bool isRevoked() const { return mFlag & REVOKE; }
        bool isSEP() const { return mFlag & SEP; }

        /*!
         * key tag of this key (RFC 4034 Appendix B)
         */
        uint16_t getKeyTag() const;

        virtual std::string toZone() const;
        virtual std::string toString() const;

        virtual void outputWireFormat( WireFormat &message ) const;
        virtual void outputCanonicalWireFormat( WireFormat &message ) const;
        virtual uint16_t size() const
        {
            return sizeof( mFlag ) + sizeof( mProtocol ) + sizeof( mAlgorithm ) + mPublicKey.size();
        }

        virtual Type type() const
        {
            return TYPE_DNSKEY;
        }

        static RDATAPtr parse( const uint8_t *packet_begin, const uint8_t *packet_end, const uint8_t *rdata_begin, const uint8_t *rdata_end );
    };

    class RecordDS : public RDATA
    {
    private:
        uint16_t             mKeyTag;
        uint8_t              mAlgorithm;
        uint8_t              mDigestType;
        std::vector<uint8_t> mDigest;

    public:
        RecordDS( uint16_t tag, uint8_t alg, uint8_t dtype, const std::vector<uint8_t> &d )
            : mKeyTag( tag ), mAlgorithm( alg ), mDigestType( dtype ), mDigest( d )
        {
        }

        uint16_t getKeyTag() const { return mKeyTag; }
        uint8_t  getAlgorithm() const { return mAlgorithm; }
        uint8_t  getDigestType() const { return mDigestType; }
        const std::vector<uint8_t> &getDigest() const { return mDigest; }

        virtual std::string toZone() const;
        virtual std::string toString() const;
        virtual void outputWireFormat( WireFormat &message ) const;
        virtual void outputCanonicalWireFormat( WireFormat &message ) const;
        virtual uint16_t size() const
        {
            return 2 + 1 + 1 + mDigest.size();
        }

        virtual Type type() const
        {
            return TYPE_DS;
        }

        static RDATAPtr parse( const uint8_t *packet_begin, const uint8_t *packet_end, const uint8_t *rdata_begin, const uint8_t *rdata_end );
    };

    /*!
     * TLSA RDATA (RFC 6698 2.1)
     */
    class RecordTLSA : public RDATA
    {
    private:
        uint8_t              mUsage;
        uint8_t              mSelector;
        uint8_t              mMatchingType;
        std::vector<uint8_t> mData;

    public:
        RecordTLSA( uint8_t usage, uint8_t selector, uint8_t matching_type, const std::vector<uint8_t> &data )
            : mUsage( usage ), mSelector( selector ), mMatchingType( matching_type ), mData( data )
        {
        }

        uint8_t getUsage() const { return mUsage; }
        uint8_t getSelector() const { return mSelector; }
        uint8_t getMatchingType() const { return mMatchingType; }
        const std::vector<uint8_t> &getAssociationData() const { return mData; }

        virtual std::string toZone() const;
        virtual std::string toString() const;
        virtual void outputWireFormat( WireFormat &message ) const;
        virtual void outputCanonicalWireFormat( WireFormat &message ) const;
        virtual uint16_t size() const
        {
            return 3 + mData.size();
        }

        virtual Type type() const
        {
            return TYPE_TLSA;
        }

        static RDATAPtr parse( const uint8_t *packet_begin, const uint8_t *packet_end, const uint8_t *rdata_begin, const uint8_t *rdata_end );
    };

    struct EDNSOption {
        uint16_t             mCode;
        std::vector<uint8_t> mData;
    };

    class RecordOptionsData : public RDATA
    {
    private:
        std::vector<EDNSOption> mOptions;

    public:
        RecordOptionsData( const std::vector<EDNSOption> &options = std::vector<EDNSOption>() ) : mOptions( options )
        {
        }

        virtual std::string toZone() const { return ""; }
        virtual std::string toString() const;
        virtual void outputWireFormat( WireFormat &message ) const;
        virtual void outputCanonicalWireFormat( WireFormat &message ) const;
        virtual Type type() const
        {
            return TYPE_OPT;
        }
        virtual uint16_t size() const;

        const std::vector<EDNSOption> &getOptions() const
        {
            return mOptions;
        }

        static RDATAPtr parse( const uint8_t *packet_begin, const uint8_t *packet_end, const uint8_t *rdata_begin, const uint8_t *rdata_end );
    };

    struct OptPseudoRecord {
        uint16_t mPayloadSize;
        uint8_t  mRCode;
        uint8_t  mVersion;
        bool     mDOBit;
        RDATAPtr mOptions;

        OptPseudoRecord()
            : mPayloadSize( EDNS_PAYLOAD_SIZE ), mRCode( 0 ), mVersion( 0 ), mDOBit( false ), mOptions( new RecordOptionsData )
        {
        }
    };

    struct QuestionSectionEntry {
        Domainname mDomainname;
        Type       mType;
        Class      mClass;

        QuestionSectionEntry() : mType( 0 ), mClass( CLASS_IN )
        {
        }

        uint16_t size() const;
    };

    struct ResourceRecord {
        Domainname mDomainname;
        Type       mType;
        Class      mClass;
        TTL        mTTL;
        RDATAPtr   mRData;

        ResourceRecord() : mType( 0 ), mClass( CLASS_IN ), mTTL( 0 )
        {
        }

        uint32_t size() const;
    };

    struct MessageInfo {
        uint16_t mID;

        bool    mQueryResponse;
        uint8_t mOpcode;
        bool    mAuthoritativeAnswer;
        bool    mTruncation;
        bool    mRecursionDesired;

        bool    mRecursionAvailable;
        bool    mZeroField;
        bool    mAuthenticData;
        bool    mCheckingDisabled;
        uint8_t mResponseCode;

        bool            mIsEDNS0;
        OptPseudoRecord mOptPseudoRR;

        std::vector<QuestionSectionEntry> mQuestionSection;
        std::vector<ResourceRecord>       mAnswerSection;
        std::vector<ResourceRecord>       mAuthoritySection;
        std::vector<ResourceRecord>       mAdditionalSection;

        MessageInfo()
            : mID( 0 ),
              mQueryResponse( false ),
              mOpcode( OPCODE_QUERY ),
              mAuthoritativeAnswer( false ),
              mTruncation( false ),
              mRecursionDesired( false ),
              mRecursionAvailable( false ),
              mZeroField( false ),
              mAuthenticData( false ),
              mCheckingDisabled( false ),
              mResponseCode( NO_ERROR ),
              mIsEDNS0( false )
        {
        }

        bool isEDNS0() const
        {
            return mIsEDNS0;
        }

        bool isDNSSECOK() const
        {
            return mIsEDNS0 && mOptPseudoRR.mDOBit;
        }

        const std::vector<QuestionSectionEntry> &getQuestionSection() const { return mQuestionSection; }
        const std::vector<ResourceRecord> &      getAnswerSection() const { return mAnswerSection; }
        const std::vector<ResourceRecord> &      getAuthoritySection() const { return mAuthoritySection; }
        const std::vector<ResourceRecord> &      getAdditionalSection() const { return mAdditionalSection; }

        void pushQuestionSection( const QuestionSectionEntry &e ) { mQuestionSection.push_back( e ); }
        void pushAnswerSection( const ResourceRecord &e ) { mAnswerSection.push_back( e ); }
        void pushAuthoritySection( const ResourceRecord &e ) { mAuthoritySection.push_back( e ); }
        void pushAdditionalSection( const ResourceRecord &e ) { mAdditionalSection.push_back( e ); }

        void     generateMessage( WireFormat & ) const;
        uint32_t getMessageSize() const;
    };

    MessageInfo   parseDNSMessage( const uint8_t *begin, const uint8_t *end );
    std::ostream &operator<<( std::ostream &os, const MessageInfo &message );
    std::string   typeCodeToString( Type t );
    std::string   responseCodeToString( uint8_t rcode );
    Type          stringToTypeCode( const std::string & );

    struct PacketHeaderField {
        uint16_t id;

        uint8_t recursion_desired : 1;
        uint8_t truncation : 1;
        uint8_t authoritative_answer : 1;
        uint8_t opcode : 4;
        uint8_t query_response : 1;

        uint8_t response_code : 4;
        uint8_t checking_disabled : 1;
        uint8_t authentic_data : 1;
        uint8_t zero_field : 1;
        uint8_t recursion_available : 1;

        uint16_t question_count;
        uint16_t answer_count;
        uint16_t authority_count;
        uint16_t additional_infomation_count;
    };

    ResourceRecord  generateOptPseudoRecord( const OptPseudoRecord & );
    OptPseudoRecord parseOPTPseudoRecord( const ResourceRecord & );

    template <typename Type>
    Type get_bytes( const uint8_t **pos )
    {
        Type v;
        std::memcpy( &v, *pos, sizeof( Type ) );
        *pos += sizeof( Type );
        return v;
    }
}

#endif
