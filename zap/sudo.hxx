// file      : zap/sudo.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef ZAP_SUDO_HXX
#define ZAP_SUDO_HXX

#include <mutex>

#include <zap/types.hxx>
#include <zap/utility.hxx>

namespace zap
{
  // Privileged command execution with the elevation credential requested at
  // most once per session.
  //
  // The credential is either the password verified with `sudo -S -v` or the
  // passwordless marker (represented as an empty password) if `sudo -n true`
  // succeeds. Once established it is never re-requested or changed. If the
  // process already runs as root, then the commands are executed directly
  // and no credential is ever requested.
  //
  // Both ensure_credential() and the run*() functions can be called from
  // multiple threads. The first credential acquisition is serialized so that
  // the user is never prompted twice and the commands are executed one at a
  // time.
  //
  class sudo_session
  {
  public:
    explicit
    sudo_session (path sudo = path ("sudo")): sudo_ (move (sudo)) {}

    sudo_session (const sudo_session&) = delete;
    sudo_session& operator= (const sudo_session&) = delete;

    // Return true unless running as root.
    //
    bool
    needs_elevation () const;

    // Establish the credential if not yet done, prompting for the password
    // (without echo) if necessary. Issue diagnostics and throw failed if the
    // password is rejected or cannot be read. This failure is final: any
    // later call throws failed again without prompting.
    //
    void
    ensure_credential ();

    // Run the command (NULL-terminated argument list without the sudo
    // program) with elevated privileges, inheriting the standard streams
    // (except stdin while the password is being transmitted). Return true if
    // the command exited with zero status. Issue diagnostics and throw failed
    // if the command cannot be executed.
    //
    bool
    run (const cstrings& args, const dir_path& cwd = dir_path ());

    // As above but capture and return stdout. Return nullopt if the command
    // exited with non-zero status.
    //
    optional<string>
    run_output (const cstrings& args);

    // Testing hooks.
    //
    // If set, then the sudo program and the commands are not executed.
    // Instead the probe, verification, and command outcomes are taken from
    // the simulation and the executed command lines (including the sudo
    // program and its options) are recorded. The prompt answers are consumed
    // in order and running out of them is treated as the password read
    // failure.
    //
    struct simulation
    {
      bool    elevated = false;     // Running as root.
      bool    passwordless = false; // `sudo -n true` succeeds.
      string  password;             // Password accepted by `sudo -S -v`.
      strings answers;              // Passwords typed at the prompt.

      // Return the exit status and output of the command (without the sudo
      // program). If absent, then the command succeeds with no output.
      //
      function<bool (const strings&)>   execute;
      function<string (const strings&)> output;

      // Recorded.
      //
      size_t          prompts = 0;
      vector<strings> commands;
    };

    simulation* simulate_ = nullptr;

  private:
    bool
    probe ();

    bool
    verify (const string& password);

    string
    prompt ();

    // Build the command line prefixing it with the sudo program, if
    // necessary. Return true if the password needs to be written to stdin.
    //
    bool
    command (const cstrings& args, cstrings& cmd) const;

    bool
    simulate (const cstrings& cmd, size_t n, string* out);

  private:
    path sudo_;

    optional<string> credential_; // Empty string is the passwordless marker.
    bool auth_failed_ = false;

    std::mutex state_mutex_;
    std::mutex run_mutex_;
  };
}

#endif // ZAP_SUDO_HXX
