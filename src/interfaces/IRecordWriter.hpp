#ifndef IRECORDWRITER_HPP
#define IRECORDWRITER_HPP

// Write side of a backing store. Returning normally is the acknowledgement:
// the store must durably reflect the change by then. Failures are thrown.
template <typename Key, typename Record>
class IRecordWriter {
public:
    virtual ~IRecordWriter() = default;
    virtual void persist(const Record& record) = 0;
    // Deleting an absent key is not an error.
    virtual void erase(const Key& key) = 0;
};

#endif // IRECORDWRITER_HPP
