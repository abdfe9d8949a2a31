#include <filesystem>
#include <fstream>
#include <string>

#include "TestSupport.hpp"
#include "storage/FileStorage.hpp"

int main() {
    if (!initTestEnv()) FAIL();

    const auto dir = tempDir("sessiongate_file_storage");
    const std::string path = (dir / "store.db").string();

    User alice = makeUser("Alice", "alice@example.com");
    alice.password_hash = "$argon2id$v=19$m=8,t=1,p=1$c2FsdA$aGFzaA";
    User bob = makeUser("Bob", "bob@example.com");

    Session s;
    s.id = User::generateID();
    s.user_id = alice.id;
    s.access_token = std::string(64, 'a');
    s.refresh_token = std::string(64, 'b');
    s.created_at = 1700000000;
    s.expires_at = 1700003600;
    s.refresh_expires_at = 1700604800;
    s.last_active = 1700000000;

    VerificationRequest code;
    code.user_id = bob.id;
    code.code = 48213;
    code.expires_at = 1700003600;

    // Missing file is an empty store; every mutation lands on disk.
    {
        FileStorage store(path);
        EXPECT(store.load());
        EXPECT(store.userCount() == 0);
        EXPECT(!std::filesystem::exists(path));

        EXPECT(store.insertUser(alice) == StoreStatus::Ok);
        EXPECT(std::filesystem::exists(path));
        EXPECT(!std::filesystem::exists(path + ".tmp"));

        EXPECT(store.insertUserWithVerification(bob, code) == StoreStatus::Ok);
        EXPECT(store.insertUser(alice) == StoreStatus::Conflict);
        EXPECT(store.markEmailVerified(alice.id, 1700000100) == StoreStatus::Ok);
        EXPECT(store.insertSession(s) == StoreStatus::Ok);
        EXPECT(store.revokeSession(s.id, 1700000200) == StoreStatus::Ok);
    }

    // A second instance reads back exactly what was written.
    {
        FileStorage store(path);
        EXPECT(store.load());
        EXPECT(store.userCount() == 2);
        EXPECT(store.sessionCount() == 1);

        User u;
        EXPECT(store.findUserByEmail("alice@example.com", u) == StoreStatus::Ok);
        EXPECT(u.id == alice.id);
        EXPECT(u.name == "Alice");
        EXPECT(u.password_hash == alice.password_hash);
        EXPECT(u.email_verified_at == 1700000100);
        EXPECT(u.created_at == alice.created_at);

        EXPECT(store.findUserById(bob.id, u) == StoreStatus::Ok);
        EXPECT(u.email == "bob@example.com");
        EXPECT(!u.isVerified());

        Session back;
        EXPECT(store.findSession(s.id, back) == StoreStatus::Ok);
        EXPECT(back.user_id == s.user_id);
        EXPECT(back.access_token == s.access_token);
        EXPECT(back.refresh_token == s.refresh_token);
        EXPECT(back.expires_at == s.expires_at);
        EXPECT(back.refresh_expires_at == s.refresh_expires_at);
        EXPECT(back.revoked_at == 1700000200);

        VerificationRequest v;
        EXPECT(store.findVerification(bob.id, v) == StoreStatus::Ok);
        EXPECT(v.code == 48213);
        EXPECT(v.expires_at == 1700003600);

        // Conditional replace: a code expiring after the bound blocks, one expiring at it yields.
        VerificationRequest next = code;
        next.code = 11111;
        next.expires_at = 1700004000;
        VerificationRequest current;
        EXPECT(store.replaceVerificationIfStale(next, 1700003000, current) == StoreStatus::Conflict);
        EXPECT(current.code == 48213);
        EXPECT(store.replaceVerificationIfStale(next, 1700003600, current) == StoreStatus::Ok);

        // Codes for unknown users are refused.
        VerificationRequest stray;
        stray.user_id = "no-such-user";
        stray.code = 12345;
        EXPECT(store.upsertVerification(stray) == StoreStatus::NotFound);
    }

    {
        FileStorage store(path);
        EXPECT(store.load());
        VerificationRequest v;
        EXPECT(store.findVerification(bob.id, v) == StoreStatus::Ok);
        EXPECT(v.code == 11111);
    }

    // Malformed files are refused and leave the store empty.
    {
        const std::string bad = (dir / "bad.db").string();
        const char* corrupt[] = {
            "",
            "NOTASTORE\n",
            "SGSTORE1\nusers 1\nid-only\n",
            "SGSTORE1\nusers 0\nsessions 0\n",
            "SGSTORE1\nusers 0\nsessions 0\nverifications 1\nuid\nnot-a-number\n1\n---\n",
            "SGSTORE1\nusers 0\nsessions 0\nverifications 1\nuid\n12345\n1\n+++\n"
        };
        for (const char* text : corrupt) {
            {
                std::ofstream out(bad, std::ios::trunc);
                out << text;
            }
            FileStorage store(bad);
            if (store.load()) {
                std::cerr << "accepted corrupt store: " << text << "\n";
                FAIL();
            }
            if (store.userCount() != 0 || store.sessionCount() != 0) FAIL();
        }
    }

    // Unwritable location: the write fails and the in-memory change is undone.
    {
        FileStorage store((dir / "no-such-dir" / "store.db").string());
        EXPECT(store.load());
        EXPECT(store.insertUser(alice) == StoreStatus::Failure);
        EXPECT(store.userCount() == 0);
        User u;
        EXPECT(store.findUserByEmail(alice.email, u) == StoreStatus::NotFound);
    }

    return 0;
}
