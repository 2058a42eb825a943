// *****************************************************************************
// * This file is part of the SyncBridge project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef PATH_MAPPING_H_1209384712309487
#define PATH_MAPPING_H_1209384712309487

#include <zen/zstring.h>


namespace sb
{
/*  translate between local and remote absolute paths via their root-relative form:

        localRoot/rel/path  <->  rel/path  <->  remoteRoot/rel/path

    - both roots are absolute, '/'-separated
    - relative paths use '/' and never start with a separator; "" denotes the root itself
    - a path outside of the respective root is a contract violation => std::logic_error     */
class PathMapping
{
public:
    PathMapping(const Zstring& localRoot, const Zstring& remoteRoot);

    Zstring toRemote(const Zstring& localPath ) const; //throw std::logic_error
    Zstring toLocal (const Zstring& remotePath) const; //

    Zstring localToRelative (const Zstring& localPath ) const; //throw std::logic_error
    Zstring remoteToRelative(const Zstring& remotePath) const; //

    Zstring localFromRelative (const Zstring& relPath) const; //throw std::logic_error
    Zstring remoteFromRelative(const Zstring& relPath) const; //

    const Zstring& getLocalRoot () const { return localRoot_; }
    const Zstring& getRemoteRoot() const { return remoteRoot_; }

private:
    const Zstring localRoot_;
    const Zstring remoteRoot_;
};
}

#endif //PATH_MAPPING_H_1209384712309487
